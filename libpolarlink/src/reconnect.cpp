/**
 * @file reconnect.cpp
 * @brief Back-off computation
 */

#include "polarlink/reconnect.h"
#include <algorithm>

namespace polarlink {

std::chrono::milliseconds
ReconnectPolicy::delay_for_attempt(int attempt) const {
  if (attempt < 1) {
    return std::chrono::milliseconds(0);
  }

  // Doubling past max_interval is pointless; stop before overflow
  std::chrono::milliseconds::rep delay = base_interval.count();
  for (int i = 1; i < attempt && delay < max_interval.count(); ++i) {
    delay *= 2;
  }

  return std::chrono::milliseconds(std::min(delay, max_interval.count()));
}

} // namespace polarlink
