/**
 * @file test_data_quality.cpp
 * @brief Unit tests for heart rate signal quality scoring
 */

#include <gtest/gtest.h>
#include <polarlink/data_quality.h>

using namespace polarlink;
using namespace std::chrono;

class DataQualityTest : public ::testing::Test {
protected:
  using TimePoint = DataQualityMonitor::TimePoint;

  TimePoint at(double seconds) const {
    return start + duration_cast<system_clock::duration>(
                       duration<double>(seconds));
  }

  TimePoint start = system_clock::now();
};

TEST_F(DataQualityTest, NoStatsWhenEmpty) {
  DataQualityMonitor monitor;
  EXPECT_FALSE(monitor.get_stats().has_value());
  EXPECT_DOUBLE_EQ(monitor.signal_quality(), 100.0);
}

TEST_F(DataQualityTest, SteadyReadingsScorePerfect) {
  DataQualityMonitor monitor;
  for (int i = 0; i < 5; ++i) {
    monitor.add_reading(at(i), 70);
  }

  auto stats = monitor.get_stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_DOUBLE_EQ(stats->signal_quality, 100.0);
  EXPECT_EQ(stats->data_gaps, 0);
  EXPECT_EQ(stats->anomalies, 0);
  EXPECT_DOUBLE_EQ(stats->mean_hr, 70.0);
  EXPECT_DOUBLE_EQ(stats->std_dev, 0.0);
  EXPECT_EQ(stats->buffer_size, 5u);
}

TEST_F(DataQualityTest, GapPenalty) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 70);
  monitor.add_reading(at(3), 70); // 3 s gap: -30

  EXPECT_EQ(monitor.data_gaps(), 1);
  EXPECT_DOUBLE_EQ(monitor.signal_quality(), (100.0 + 70.0) / 2);
}

TEST_F(DataQualityTest, GapPenaltyIsCapped) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 70);
  monitor.add_reading(at(20), 70); // would be -200, capped at -50

  EXPECT_DOUBLE_EQ(monitor.signal_quality(), (100.0 + 50.0) / 2);
}

TEST_F(DataQualityTest, OneSecondCadenceIsNotAGap) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 70);
  monitor.add_reading(at(1.1), 70);
  EXPECT_EQ(monitor.data_gaps(), 0);
}

TEST_F(DataQualityTest, OutOfRangeAnomaly) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 250);

  EXPECT_EQ(monitor.anomalies(), 1);
  EXPECT_DOUBLE_EQ(monitor.signal_quality(), 50.0);
}

TEST_F(DataQualityTest, SuddenChangeAnomaly) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 70);
  monitor.add_reading(at(1), 95); // change 25: -25

  EXPECT_EQ(monitor.anomalies(), 1);
  EXPECT_DOUBLE_EQ(monitor.signal_quality(), (100.0 + 75.0) / 2);
}

TEST_F(DataQualityTest, SuddenChangePenaltyIsCapped) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 60);
  monitor.add_reading(at(1), 150); // change 90: capped at -30

  EXPECT_DOUBLE_EQ(monitor.signal_quality(), (100.0 + 70.0) / 2);
}

TEST_F(DataQualityTest, ChangeOfTwentyIsAllowed) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 70);
  monitor.add_reading(at(1), 90);
  EXPECT_EQ(monitor.anomalies(), 0);
}

TEST_F(DataQualityTest, ScoreNeverNegative) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 60);
  // Gap -50, out of range -50, jump -30
  monitor.add_reading(at(10), 250);

  EXPECT_EQ(monitor.data_gaps(), 1);
  EXPECT_EQ(monitor.anomalies(), 2);
  EXPECT_DOUBLE_EQ(monitor.signal_quality(), (100.0 + 0.0) / 2);
}

TEST_F(DataQualityTest, QualityUsesRecentWindow) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 250); // 50
  for (int i = 1; i <= 10; ++i) {
    monitor.add_reading(at(i), 70);
  }
  // Reading 1 jumps from 250 to 70 and scores 70; the first score is
  // outside the window of ten
  EXPECT_DOUBLE_EQ(monitor.signal_quality(), (70.0 + 9 * 100.0) / 10);
}

TEST_F(DataQualityTest, BufferIsBounded) {
  DataQualityMonitor monitor(5);
  for (int i = 0; i < 12; ++i) {
    monitor.add_reading(at(i), 60 + i);
  }

  EXPECT_EQ(monitor.buffer_size(), 5u);
  auto stats = monitor.get_stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_DOUBLE_EQ(stats->mean_hr, 69.0); // 67..71
}

TEST_F(DataQualityTest, SampleStandardDeviation) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 60);
  monitor.add_reading(at(1), 70);

  auto stats = monitor.get_stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_NEAR(stats->std_dev, 7.0710678, 1e-6);
}

TEST_F(DataQualityTest, ClearResets) {
  DataQualityMonitor monitor;
  monitor.add_reading(at(0), 250);
  monitor.add_reading(at(5), 70);
  monitor.clear();

  EXPECT_EQ(monitor.buffer_size(), 0u);
  EXPECT_EQ(monitor.data_gaps(), 0);
  EXPECT_EQ(monitor.anomalies(), 0);
  EXPECT_DOUBLE_EQ(monitor.signal_quality(), 100.0);

  // No gap is measured against readings from before the clear
  monitor.add_reading(at(100), 70);
  EXPECT_EQ(monitor.data_gaps(), 0);
}
