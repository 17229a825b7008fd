/**
 * @file platform.h
 * @brief Platform checks and export macros for PolarLink
 *
 * PolarLink talks to BlueZ and therefore only supports Linux.
 */

#ifndef POLARLINK_PLATFORM_H
#define POLARLINK_PLATFORM_H

// ============================================================================
// Platform Detection (Linux only)
// ============================================================================

#if !defined(__linux__)
#error "Unsupported platform. PolarLink only supports Linux."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef POLARLINK_BUILDING_SHARED
#define POLARLINK_API __attribute__((visibility("default")))
#else
#define POLARLINK_API
#endif

// ============================================================================
// Feature Detection
// ============================================================================

// Bluetooth support (BlueZ over the system D-Bus)
#ifdef HAS_BLUEZ
#define POLARLINK_HAS_BLUETOOTH 1
#define POLARLINK_BLUETOOTH_BLUEZ 1
#endif

#endif // POLARLINK_PLATFORM_H
