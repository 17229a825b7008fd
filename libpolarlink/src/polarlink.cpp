/**
 * @file polarlink.cpp
 * @brief Library version information
 */

#include "polarlink/polarlink.h"

namespace polarlink {

VersionInfo get_version() {
  VersionInfo info;
#if defined(POLARLINK_HAS_BLUETOOTH)
  info.bluetooth_backend = true;
#endif
  return info;
}

} // namespace polarlink
