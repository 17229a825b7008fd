/**
 * @file data_quality.h
 * @brief Heart rate signal quality scoring
 *
 * Each reading is scored from 100 down:
 *   - gap since previous reading > 1.1 s:  -min(50, gap_seconds * 10)
 *   - bpm outside 30..240:                  -50
 *   - jump of more than 20 bpm:             -min(30, jump)
 * The reported signal quality is the mean score of the newest 10
 * readings.
 */

#ifndef POLARLINK_DATA_QUALITY_H
#define POLARLINK_DATA_QUALITY_H

#include "platform.h"
#include "sample_buffer.h"
#include "types.h"
#include <chrono>
#include <mutex>
#include <optional>

namespace polarlink {

/**
 * @brief Buffers recent heart rate readings and tracks their quality
 *
 * Thread-safe.
 */
class POLARLINK_API DataQualityMonitor {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  static constexpr double GAP_THRESHOLD_SECONDS = 1.1;
  static constexpr int SUDDEN_CHANGE_BPM = 20;
  static constexpr size_t QUALITY_WINDOW = 10;

  explicit DataQualityMonitor(size_t buffer_size = 60);

  /**
   * @brief Score a new reading and add it to the buffer
   */
  void add_reading(TimePoint timestamp, int bpm);

  /**
   * @brief Current statistics, or nullopt if nothing has been recorded
   */
  std::optional<QualityStats> get_stats() const;

  double signal_quality() const;
  int data_gaps() const;
  int anomalies() const;
  size_t buffer_size() const;

  /// Drop all readings and counters
  void clear();

private:
  struct Entry {
    TimePoint timestamp;
    int bpm = 0;
    double quality = 100.0;
  };

  double calculate_quality(TimePoint timestamp, int bpm);
  void update_signal_quality();

  mutable std::mutex mutex_;
  SampleRing<Entry> buffer_;
  double signal_quality_ = 100.0;
  std::optional<TimePoint> last_update_;
  int data_gaps_ = 0;
  int anomalies_ = 0;
};

} // namespace polarlink

#endif // POLARLINK_DATA_QUALITY_H
