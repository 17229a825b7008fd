/**
 * @file test_hr_series.cpp
 * @brief Unit tests for the live plot data model
 */

#include <gtest/gtest.h>
#include <polarlink/hr_series.h>

using namespace polarlink;

TEST(HeartRateSeriesTest, StartsEmpty) {
  HeartRateSeries series;
  EXPECT_TRUE(series.empty());
  EXPECT_EQ(series.max_points(), 100u);
  EXPECT_FALSE(series.min_bpm().has_value());
  EXPECT_DOUBLE_EQ(series.last_x(), 0.0);
}

TEST(HeartRateSeriesTest, XAdvancesByOne) {
  HeartRateSeries series;
  series.update(70);
  series.update(72);
  series.update(71);

  EXPECT_EQ(series.timestamps(), std::vector<double>({0.0, 1.0, 2.0}));
  EXPECT_EQ(series.heart_rates(), std::vector<int>({70, 72, 71}));
}

TEST(HeartRateSeriesTest, SlidingWindow) {
  HeartRateSeries series(3);
  for (int bpm = 60; bpm < 65; ++bpm) {
    series.update(bpm);
  }

  EXPECT_EQ(series.size(), 3u);
  EXPECT_EQ(series.heart_rates(), std::vector<int>({62, 63, 64}));
  EXPECT_DOUBLE_EQ(series.first_x(), 2.0);
  EXPECT_DOUBLE_EQ(series.last_x(), 4.0);
}

TEST(HeartRateSeriesTest, MinMax) {
  HeartRateSeries series;
  series.update(80);
  series.update(55);
  series.update(120);

  EXPECT_EQ(series.min_bpm().value(), 55);
  EXPECT_EQ(series.max_bpm().value(), 120);
}

TEST(HeartRateSeriesTest, ResizeKeepsNewest) {
  HeartRateSeries series;
  for (int bpm = 60; bpm < 70; ++bpm) {
    series.update(bpm);
  }

  series.set_max_points(4);
  EXPECT_EQ(series.max_points(), 4u);
  EXPECT_EQ(series.heart_rates(), std::vector<int>({66, 67, 68, 69}));
  EXPECT_DOUBLE_EQ(series.first_x(), 6.0);

  series.update(70);
  EXPECT_EQ(series.size(), 4u);
  EXPECT_DOUBLE_EQ(series.last_x(), 10.0);

  series.set_max_points(0);
  EXPECT_EQ(series.max_points(), 1u);
  EXPECT_EQ(series.heart_rates(), std::vector<int>({70}));
}

TEST(HeartRateSeriesTest, ClearRestartsAtZero) {
  HeartRateSeries series;
  series.update(70);
  series.update(70);
  series.clear();
  EXPECT_TRUE(series.empty());

  series.update(65);
  EXPECT_DOUBLE_EQ(series.first_x(), 0.0);
}

TEST(HeartRateSeriesTest, DisplayConstants) {
  EXPECT_EQ(HR_PLOT_MIN_BPM, 40);
  EXPECT_EQ(HR_PLOT_MAX_BPM, 200);
  EXPECT_EQ(HR_PLOT_INITIAL_WINDOW_S, 30);
  EXPECT_STREQ(HR_PLOT_TITLE, "Real-time Heart Rate");
}
