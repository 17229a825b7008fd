/**
 * @file hr_series.cpp
 * @brief Heart rate plot model
 */

#include "polarlink/hr_series.h"
#include <algorithm>

namespace polarlink {

HeartRateSeries::HeartRateSeries(size_t max_points)
    : max_points_(max_points > 0 ? max_points : 1) {}

void HeartRateSeries::update(int bpm) {
  double x = points_.empty() ? 0.0 : points_.back().x + 1.0;
  points_.push_back({x, bpm});

  while (points_.size() > max_points_) {
    points_.pop_front();
  }
}

void HeartRateSeries::clear() { points_.clear(); }

void HeartRateSeries::set_max_points(size_t max_points) {
  max_points_ = max_points > 0 ? max_points : 1;
  while (points_.size() > max_points_) {
    points_.pop_front();
  }
}

std::vector<double> HeartRateSeries::timestamps() const {
  std::vector<double> out;
  out.reserve(points_.size());
  for (const auto &p : points_) {
    out.push_back(p.x);
  }
  return out;
}

std::vector<int> HeartRateSeries::heart_rates() const {
  std::vector<int> out;
  out.reserve(points_.size());
  for (const auto &p : points_) {
    out.push_back(p.bpm);
  }
  return out;
}

std::optional<int> HeartRateSeries::min_bpm() const {
  if (points_.empty()) {
    return std::nullopt;
  }
  return std::min_element(points_.begin(), points_.end(),
                          [](const Point &a, const Point &b) {
                            return a.bpm < b.bpm;
                          })
      ->bpm;
}

std::optional<int> HeartRateSeries::max_bpm() const {
  if (points_.empty()) {
    return std::nullopt;
  }
  return std::max_element(points_.begin(), points_.end(),
                          [](const Point &a, const Point &b) {
                            return a.bpm < b.bpm;
                          })
      ->bpm;
}

double HeartRateSeries::first_x() const {
  return points_.empty() ? 0.0 : points_.front().x;
}

double HeartRateSeries::last_x() const {
  return points_.empty() ? 0.0 : points_.back().x;
}

} // namespace polarlink
