/**
 * @file test_sample_buffer.cpp
 * @brief Unit tests for the fixed-capacity sample ring
 */

#include <gtest/gtest.h>
#include <polarlink/sample_buffer.h>

using namespace polarlink;

TEST(SampleRingTest, StartsEmpty) {
  SampleRing<int> ring(4);
  EXPECT_TRUE(ring.empty());
  EXPECT_EQ(ring.capacity(), 4u);
  EXPECT_TRUE(ring.to_vector().empty());
}

TEST(SampleRingTest, KeepsInsertionOrder) {
  SampleRing<int> ring(4);
  ring.push(1);
  ring.push(2);
  ring.push(3);

  EXPECT_EQ(ring.size(), 3u);
  EXPECT_FALSE(ring.full());
  EXPECT_EQ(ring.front(), 1);
  EXPECT_EQ(ring.back(), 3);
  EXPECT_EQ(ring.to_vector(), std::vector<int>({1, 2, 3}));
}

TEST(SampleRingTest, OverwritesOldest) {
  SampleRing<int> ring(3);
  for (int i = 1; i <= 5; ++i) {
    ring.push(i);
  }

  EXPECT_TRUE(ring.full());
  EXPECT_EQ(ring.size(), 3u);
  EXPECT_EQ(ring.front(), 3);
  EXPECT_EQ(ring.back(), 5);
  EXPECT_EQ(ring[1], 4);
}

TEST(SampleRingTest, LastN) {
  SampleRing<int> ring(5);
  for (int i = 0; i < 8; ++i) {
    ring.push(i);
  }

  EXPECT_EQ(ring.last(2), std::vector<int>({6, 7}));
  EXPECT_EQ(ring.last(100), std::vector<int>({3, 4, 5, 6, 7}));
  EXPECT_TRUE(ring.last(0).empty());
}

TEST(SampleRingTest, ZeroCapacityHoldsOne) {
  SampleRing<int> ring(0);
  EXPECT_EQ(ring.capacity(), 1u);
  ring.push(7);
  ring.push(8);
  EXPECT_EQ(ring.to_vector(), std::vector<int>({8}));
}

TEST(SampleRingTest, Clear) {
  SampleRing<int> ring(3);
  ring.push(1);
  ring.push(2);
  ring.clear();
  EXPECT_TRUE(ring.empty());

  ring.push(9);
  EXPECT_EQ(ring.front(), 9);
}
