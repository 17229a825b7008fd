/**
 * @file data_quality.cpp
 * @brief Heart rate signal quality implementation
 */

#include "polarlink/data_quality.h"
#include "polarlink/heart_rate.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace polarlink {

DataQualityMonitor::DataQualityMonitor(size_t buffer_size)
    : buffer_(buffer_size) {}

void DataQualityMonitor::add_reading(TimePoint timestamp, int bpm) {
  std::lock_guard<std::mutex> lock(mutex_);

  Entry entry;
  entry.timestamp = timestamp;
  entry.bpm = bpm;
  entry.quality = calculate_quality(timestamp, bpm);

  buffer_.push(entry);
  update_signal_quality();
  last_update_ = timestamp;
}

double DataQualityMonitor::calculate_quality(TimePoint timestamp, int bpm) {
  double quality = 100.0;

  if (last_update_) {
    double gap =
        std::chrono::duration<double>(timestamp - *last_update_).count();
    if (gap > GAP_THRESHOLD_SECONDS) {
      ++data_gaps_;
      quality -= std::min(50.0, gap * 10.0);
    }
  }

  if (bpm < MIN_VALID_BPM || bpm > MAX_VALID_BPM) {
    ++anomalies_;
    quality -= 50.0;
  }

  if (!buffer_.empty()) {
    int change = std::abs(bpm - buffer_.back().bpm);
    if (change > SUDDEN_CHANGE_BPM) {
      ++anomalies_;
      quality -= std::min(30.0, static_cast<double>(change));
    }
  }

  return std::max(0.0, quality);
}

void DataQualityMonitor::update_signal_quality() {
  if (buffer_.empty()) {
    return;
  }

  auto recent = buffer_.last(QUALITY_WINDOW);
  double sum = 0.0;
  for (const auto &e : recent) {
    sum += e.quality;
  }
  signal_quality_ = sum / static_cast<double>(recent.size());
}

std::optional<QualityStats> DataQualityMonitor::get_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (buffer_.empty()) {
    return std::nullopt;
  }

  const size_t n = buffer_.size();
  double sum = 0.0;
  for (size_t i = 0; i < n; ++i) {
    sum += buffer_[i].bpm;
  }
  double mean = sum / static_cast<double>(n);

  // Sample standard deviation
  double std_dev = 0.0;
  if (n > 1) {
    double sq = 0.0;
    for (size_t i = 0; i < n; ++i) {
      double d = buffer_[i].bpm - mean;
      sq += d * d;
    }
    std_dev = std::sqrt(sq / static_cast<double>(n - 1));
  }

  QualityStats stats;
  stats.signal_quality = signal_quality_;
  stats.data_gaps = data_gaps_;
  stats.anomalies = anomalies_;
  stats.mean_hr = mean;
  stats.std_dev = std_dev;
  stats.buffer_size = n;
  return stats;
}

double DataQualityMonitor::signal_quality() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return signal_quality_;
}

int DataQualityMonitor::data_gaps() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_gaps_;
}

int DataQualityMonitor::anomalies() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return anomalies_;
}

size_t DataQualityMonitor::buffer_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size();
}

void DataQualityMonitor::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  buffer_.clear();
  signal_quality_ = 100.0;
  data_gaps_ = 0;
  anomalies_ = 0;
  last_update_.reset();
}

} // namespace polarlink
