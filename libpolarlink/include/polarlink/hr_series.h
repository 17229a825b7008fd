/**
 * @file hr_series.h
 * @brief Data model behind the live heart rate plot
 */

#ifndef POLARLINK_HR_SERIES_H
#define POLARLINK_HR_SERIES_H

#include "platform.h"
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace polarlink {

// Display defaults
constexpr int HR_PLOT_MIN_BPM = 40;
constexpr int HR_PLOT_MAX_BPM = 200;
constexpr int HR_PLOT_INITIAL_WINDOW_S = 30;
constexpr const char *HR_PLOT_TITLE = "Real-time Heart Rate";
constexpr const char *HR_PLOT_X_LABEL = "Time (s)";
constexpr const char *HR_PLOT_Y_LABEL = "Heart Rate (BPM)";

/**
 * @brief Sliding window of heart rate values for display
 *
 * Each update advances x by one; the first point sits at x = 0. Not
 * synchronised.
 */
class POLARLINK_API HeartRateSeries {
public:
  explicit HeartRateSeries(size_t max_points = 100);

  void update(int bpm);
  void clear();

  /// Shrinking drops the oldest points; 0 is treated as 1
  void set_max_points(size_t max_points);

  std::vector<double> timestamps() const;
  std::vector<int> heart_rates() const;

  size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }
  size_t max_points() const { return max_points_; }

  std::optional<int> min_bpm() const;
  std::optional<int> max_bpm() const;

  /// x of the oldest / newest point (0 when empty)
  double first_x() const;
  double last_x() const;

private:
  struct Point {
    double x;
    int bpm;
  };

  size_t max_points_;
  std::deque<Point> points_;
};

} // namespace polarlink

#endif // POLARLINK_HR_SERIES_H
