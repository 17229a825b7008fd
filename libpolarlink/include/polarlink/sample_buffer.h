/**
 * @file sample_buffer.h
 * @brief Fixed-capacity ring buffer for streamed samples
 */

#ifndef POLARLINK_SAMPLE_BUFFER_H
#define POLARLINK_SAMPLE_BUFFER_H

#include <algorithm>
#include <cstddef>
#include <vector>

namespace polarlink {

/**
 * @brief Circular buffer that keeps the newest `capacity` elements
 *
 * Pushing into a full ring overwrites the oldest element. Index 0 is
 * always the oldest element still held. Not synchronised; owners guard
 * it with their own mutex.
 *
 * @code
 *   SampleRing<EcgSample> ring(1300);   // 10 s at 130 Hz
 *   ring.push(sample);
 *   auto last_second = ring.last(130);
 * @endcode
 */
template <typename T> class SampleRing {
public:
  /// A capacity of 0 is treated as 1
  explicit SampleRing(size_t capacity) : storage_(capacity > 0 ? capacity : 1) {}

  void push(const T &value) {
    storage_[head_] = value;
    head_ = (head_ + 1) % storage_.size();
    if (size_ < storage_.size()) {
      ++size_;
    }
  }

  size_t size() const { return size_; }
  size_t capacity() const { return storage_.size(); }
  bool empty() const { return size_ == 0; }
  bool full() const { return size_ == storage_.size(); }

  /// Oldest element (undefined if empty)
  const T &front() const { return (*this)[0]; }

  /// Newest element (undefined if empty)
  const T &back() const { return (*this)[size_ - 1]; }

  const T &operator[](size_t index) const {
    return storage_[(start() + index) % storage_.size()];
  }

  /// Newest `n` elements, oldest first
  std::vector<T> last(size_t n) const {
    n = std::min(n, size_);
    std::vector<T> out;
    out.reserve(n);
    for (size_t i = size_ - n; i < size_; ++i) {
      out.push_back((*this)[i]);
    }
    return out;
  }

  std::vector<T> to_vector() const { return last(size_); }

  void clear() {
    head_ = 0;
    size_ = 0;
  }

private:
  size_t start() const {
    return (head_ + storage_.size() - size_) % storage_.size();
  }

  std::vector<T> storage_;
  size_t head_ = 0; // Next write position
  size_t size_ = 0;
};

} // namespace polarlink

#endif // POLARLINK_SAMPLE_BUFFER_H
