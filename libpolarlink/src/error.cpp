/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "polarlink/error.h"
#include <sstream>

namespace polarlink {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::NotFound:
    return "NotFound";

  case ErrorCode::DiscoveryFailed:
    return "DiscoveryFailed";
  case ErrorCode::BluetoothOff:
    return "BluetoothOff";
  case ErrorCode::BluetoothNotSupported:
    return "BluetoothNotSupported";
  case ErrorCode::BleScanFailed:
    return "BleScanFailed";
  case ErrorCode::DeviceNotFound:
    return "DeviceNotFound";

  case ErrorCode::ConnectionFailed:
    return "ConnectionFailed";
  case ErrorCode::ConnectionLost:
    return "ConnectionLost";
  case ErrorCode::ConnectionTimeout:
    return "ConnectionTimeout";
  case ErrorCode::AlreadyConnected:
    return "AlreadyConnected";
  case ErrorCode::NotConnected:
    return "NotConnected";
  case ErrorCode::ServicesMissing:
    return "ServicesMissing";
  case ErrorCode::CharacteristicNotFound:
    return "CharacteristicNotFound";
  case ErrorCode::GattWriteFailed:
    return "GattWriteFailed";
  case ErrorCode::NotifyFailed:
    return "NotifyFailed";

  case ErrorCode::InvalidData:
    return "InvalidData";
  case ErrorCode::UnsupportedFrame:
    return "UnsupportedFrame";
  case ErrorCode::ValueOutOfRange:
    return "ValueOutOfRange";
  case ErrorCode::ControlCommandFailed:
    return "ControlCommandFailed";
  case ErrorCode::StreamAlreadyActive:
    return "StreamAlreadyActive";
  case ErrorCode::StreamNotActive:
    return "StreamNotActive";

  case ErrorCode::FileNotFound:
    return "FileNotFound";
  case ErrorCode::FileReadError:
    return "FileReadError";
  case ErrorCode::FileWriteError:
    return "FileWriteError";
  case ErrorCode::DirectoryCreateFailed:
    return "DirectoryCreateFailed";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";
  case ErrorCode::HardwareNotAvailable:
    return "HardwareNotAvailable";

  case ErrorCode::ConfigParseError:
    return "ConfigParseError";
  case ErrorCode::ConfigInvalid:
    return "ConfigInvalid";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";
  case ErrorCode::NotFound:
    return "Requested object not found";

  case ErrorCode::DiscoveryFailed:
    return "Device discovery failed";
  case ErrorCode::BluetoothOff:
    return "Bluetooth is disabled";
  case ErrorCode::BluetoothNotSupported:
    return "Bluetooth not supported on this system";
  case ErrorCode::BleScanFailed:
    return "BLE scanning failed";
  case ErrorCode::DeviceNotFound:
    return "No matching device found in range";

  case ErrorCode::ConnectionFailed:
    return "Failed to establish connection";
  case ErrorCode::ConnectionLost:
    return "Connection was lost unexpectedly";
  case ErrorCode::ConnectionTimeout:
    return "Connection attempt timed out";
  case ErrorCode::AlreadyConnected:
    return "Already connected to a device";
  case ErrorCode::NotConnected:
    return "Not connected to any device";
  case ErrorCode::ServicesMissing:
    return "Required GATT services not found on device";
  case ErrorCode::CharacteristicNotFound:
    return "GATT characteristic not found";
  case ErrorCode::GattWriteFailed:
    return "Writing GATT characteristic failed";
  case ErrorCode::NotifyFailed:
    return "Changing GATT notification state failed";

  case ErrorCode::InvalidData:
    return "Malformed data received from device";
  case ErrorCode::UnsupportedFrame:
    return "Frame type not supported";
  case ErrorCode::ValueOutOfRange:
    return "Value outside the plausible range";
  case ErrorCode::ControlCommandFailed:
    return "Device rejected a control command";
  case ErrorCode::StreamAlreadyActive:
    return "Stream is already active";
  case ErrorCode::StreamNotActive:
    return "Stream is not active";

  case ErrorCode::FileNotFound:
    return "File not found";
  case ErrorCode::FileReadError:
    return "Error reading file";
  case ErrorCode::FileWriteError:
    return "Error writing file";
  case ErrorCode::DirectoryCreateFailed:
    return "Could not create directory";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::PermissionDenied:
    return "Permission denied";
  case ErrorCode::ServiceUnavailable:
    return "Required service unavailable";
  case ErrorCode::HardwareNotAvailable:
    return "Required hardware not available";

  case ErrorCode::ConfigParseError:
    return "Configuration file could not be parsed";
  case ErrorCode::ConfigInvalid:
    return "Configuration values are invalid";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::NotSupported:
  case ErrorCode::BluetoothNotSupported:
  case ErrorCode::HardwareNotAvailable:
  case ErrorCode::ConfigInvalid:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace polarlink
