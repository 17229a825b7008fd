/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for the BlueZ GATT backend
 *
 * RAII wrappers around libdbus handles plus helpers for method calls,
 * property access and decoding of BlueZ's variant dictionaries.
 */

#ifndef POLARLINK_PLATFORM_LINUX_DBUS_HELPERS_H
#define POLARLINK_PLATFORM_LINUX_DBUS_HELPERS_H

#include "polarlink/error.h"
#include "polarlink/types.h"
#include <dbus/dbus.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace polarlink {
namespace platform {

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 *
 * Private connections must be closed before the last unref; shared ones
 * must not be.
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool is_private = false)
      : conn_(conn), private_(is_private) {}

  ~DBusConnectionWrapper() { release_connection(); }

  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_), private_(other.private_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      release_connection();
      conn_ = other.conn_;
      private_ = other.private_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  DBusConnection *get() const { return conn_; }
  operator bool() const { return conn_ != nullptr; }

  void reset() { release_connection(); }

private:
  void release_connection() {
    if (conn_) {
      if (private_) {
        dbus_connection_close(conn_);
      }
      dbus_connection_unref(conn_);
      conn_ = nullptr;
    }
  }

  DBusConnection *conn_ = nullptr;
  bool private_ = false;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Convert DBusError to a PolarLink Error
 */
inline Error dbus_error_to_polarlink(const DBusError &err,
                                     ErrorCode code = ErrorCode::PlatformError) {
  if (!dbus_error_is_set(&err)) {
    return Error(code, "D-Bus call failed");
  }

  std::string message = err.name ? std::string(err.name) : "D-Bus error";
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  // Permission problems are common enough to deserve their own code
  if (err.name && std::string(err.name) == DBUS_ERROR_ACCESS_DENIED) {
    code = ErrorCode::PermissionDenied;
  } else if (err.name &&
             std::string(err.name) == DBUS_ERROR_SERVICE_UNKNOWN) {
    code = ErrorCode::ServiceUnavailable;
  }

  return Error(code, message);
}

class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusErrorWrapper(const DBusErrorWrapper &) = delete;
  DBusErrorWrapper &operator=(const DBusErrorWrapper &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error() const { return dbus_error_to_polarlink(err_); }

  const char *name() const { return err_.name; }
  const char *message() const { return err_.message; }

private:
  DBusError err_;
};

// ============================================================================
// Variant Decoding
// ============================================================================

/**
 * @brief Decoded value of a D-Bus variant
 *
 * Only the shapes BlueZ uses for device and GATT properties are kept.
 */
struct VariantValue {
  int type = DBUS_TYPE_INVALID;
  std::string string_value; // STRING, OBJECT_PATH
  bool bool_value = false;
  int64_t int_value = 0;    // Any integer type
  std::vector<std::string> string_array;
  Bytes byte_array;
};

/// Property name -> value, as found in an a{sv} dictionary
using PropertyMap = std::map<std::string, VariantValue>;

/// Interface name -> properties
using InterfaceMap = std::map<std::string, PropertyMap>;

/// Object path -> interfaces
using ManagedObjects = std::map<std::string, InterfaceMap>;

/**
 * @brief Decode the variant the iterator points at
 */
inline VariantValue read_variant(DBusMessageIter *iter) {
  VariantValue out;

  DBusMessageIter variant_iter;
  if (dbus_message_iter_get_arg_type(iter) == DBUS_TYPE_VARIANT) {
    dbus_message_iter_recurse(iter, &variant_iter);
  } else {
    variant_iter = *iter;
  }

  out.type = dbus_message_iter_get_arg_type(&variant_iter);

  switch (out.type) {
  case DBUS_TYPE_STRING:
  case DBUS_TYPE_OBJECT_PATH: {
    const char *value = nullptr;
    dbus_message_iter_get_basic(&variant_iter, &value);
    out.string_value = value ? value : "";
    break;
  }
  case DBUS_TYPE_BOOLEAN: {
    dbus_bool_t value = FALSE;
    dbus_message_iter_get_basic(&variant_iter, &value);
    out.bool_value = value != FALSE;
    break;
  }
  case DBUS_TYPE_BYTE: {
    uint8_t value = 0;
    dbus_message_iter_get_basic(&variant_iter, &value);
    out.int_value = value;
    break;
  }
  case DBUS_TYPE_INT16: {
    dbus_int16_t value = 0;
    dbus_message_iter_get_basic(&variant_iter, &value);
    out.int_value = value;
    break;
  }
  case DBUS_TYPE_UINT16: {
    dbus_uint16_t value = 0;
    dbus_message_iter_get_basic(&variant_iter, &value);
    out.int_value = value;
    break;
  }
  case DBUS_TYPE_INT32: {
    dbus_int32_t value = 0;
    dbus_message_iter_get_basic(&variant_iter, &value);
    out.int_value = value;
    break;
  }
  case DBUS_TYPE_UINT32: {
    dbus_uint32_t value = 0;
    dbus_message_iter_get_basic(&variant_iter, &value);
    out.int_value = value;
    break;
  }
  case DBUS_TYPE_INT64: {
    dbus_int64_t value = 0;
    dbus_message_iter_get_basic(&variant_iter, &value);
    out.int_value = value;
    break;
  }
  case DBUS_TYPE_ARRAY: {
    DBusMessageIter array_iter;
    int elem_type = dbus_message_iter_get_element_type(&variant_iter);
    dbus_message_iter_recurse(&variant_iter, &array_iter);

    if (elem_type == DBUS_TYPE_BYTE) {
      const uint8_t *bytes = nullptr;
      int len = 0;
      dbus_message_iter_get_fixed_array(&array_iter, &bytes, &len);
      if (bytes && len > 0) {
        out.byte_array.assign(bytes, bytes + len);
      }
    } else if (elem_type == DBUS_TYPE_STRING ||
               elem_type == DBUS_TYPE_OBJECT_PATH) {
      while (dbus_message_iter_get_arg_type(&array_iter) == elem_type) {
        const char *value = nullptr;
        dbus_message_iter_get_basic(&array_iter, &value);
        if (value) {
          out.string_array.emplace_back(value);
        }
        dbus_message_iter_next(&array_iter);
      }
    }
    break;
  }
  default:
    // Dictionaries and structs are not needed
    break;
  }

  return out;
}

/**
 * @brief Decode an a{sv} dictionary the iterator points at
 */
inline PropertyMap read_property_dict(DBusMessageIter *iter) {
  PropertyMap props;

  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
    return props;
  }

  DBusMessageIter dict_iter;
  dbus_message_iter_recurse(iter, &dict_iter);

  while (dbus_message_iter_get_arg_type(&dict_iter) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry_iter;
    dbus_message_iter_recurse(&dict_iter, &entry_iter);

    const char *key = nullptr;
    dbus_message_iter_get_basic(&entry_iter, &key);
    dbus_message_iter_next(&entry_iter);

    if (key) {
      props[key] = read_variant(&entry_iter);
    }

    dbus_message_iter_next(&dict_iter);
  }

  return props;
}

// ============================================================================
// D-Bus Helper Functions
// ============================================================================

/**
 * @brief Get the shared system D-Bus connection
 */
inline Result<DBusConnectionWrapper> get_system_bus() {
  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    return error.to_error();
  }

  // The shared connection must not take the process down on disconnect
  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn);
}

/**
 * @brief Open a private system bus connection (for a signal thread)
 */
inline Result<DBusConnectionWrapper> get_private_system_bus() {
  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get_private(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    return error.to_error();
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn, true);
}

/// Appends arguments to an outgoing method call
using ArgumentWriter = std::function<void(DBusMessageIter *iter)>;

/**
 * @brief Call a D-Bus method and get reply
 * @param conn D-Bus connection
 * @param dest Destination service name
 * @param path Object path
 * @param iface Interface name
 * @param method Method name
 * @param write_args Optional argument writer
 * @param timeout_ms Timeout in milliseconds (-1 for default)
 * @return Reply message or error
 */
inline Result<DBusMessageWrapper>
call_method(DBusConnection *conn, const char *dest, const char *path,
            const char *iface, const char *method,
            const ArgumentWriter &write_args = nullptr, int timeout_ms = -1) {

  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, iface, method));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  if (write_args) {
    DBusMessageIter iter;
    dbus_message_iter_init_append(msg.get(), &iter);
    write_args(&iter);
  }

  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn, msg.get(), timeout_ms, error.get());

  if (!reply || error.is_set()) {
    return error.to_error();
  }

  return DBusMessageWrapper(reply);
}

/**
 * @brief Read one property through org.freedesktop.DBus.Properties.Get
 */
inline Result<VariantValue> get_property(DBusConnection *conn,
                                         const char *dest, const char *path,
                                         const char *iface,
                                         const char *property) {
  auto reply = call_method(conn, dest, path, "org.freedesktop.DBus.Properties",
                           "Get", [&](DBusMessageIter *iter) {
                             dbus_message_iter_append_basic(
                                 iter, DBUS_TYPE_STRING, &iface);
                             dbus_message_iter_append_basic(
                                 iter, DBUS_TYPE_STRING, &property);
                           });

  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
    return Error(ErrorCode::PlatformError, "Expected variant type");
  }

  return read_variant(&iter);
}

inline Result<std::string>
get_string_property(DBusConnection *conn, const char *dest, const char *path,
                    const char *iface, const char *property) {
  auto value = get_property(conn, dest, path, iface, property);
  if (value.is_error()) {
    return value.error();
  }

  if (value.value().type != DBUS_TYPE_STRING &&
      value.value().type != DBUS_TYPE_OBJECT_PATH) {
    return Error(ErrorCode::PlatformError, "Expected string in variant");
  }

  return value.value().string_value;
}

inline Result<bool> get_bool_property(DBusConnection *conn, const char *dest,
                                      const char *path, const char *iface,
                                      const char *property) {
  auto value = get_property(conn, dest, path, iface, property);
  if (value.is_error()) {
    return value.error();
  }

  if (value.value().type != DBUS_TYPE_BOOLEAN) {
    return Error(ErrorCode::PlatformError, "Expected boolean in variant");
  }

  return value.value().bool_value;
}

/**
 * @brief Set a basic-typed property on a D-Bus object
 */
inline Result<void> set_property(DBusConnection *conn, const char *dest,
                                 const char *path, const char *iface,
                                 const char *property, int type,
                                 const void *value) {
  auto reply = call_method(
      conn, dest, path, "org.freedesktop.DBus.Properties", "Set",
      [&](DBusMessageIter *iter) {
        DBusMessageIter variant_iter;
        dbus_message_iter_append_basic(iter, DBUS_TYPE_STRING, &iface);
        dbus_message_iter_append_basic(iter, DBUS_TYPE_STRING, &property);

        char type_sig[2] = {static_cast<char>(type), '\0'};
        dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, type_sig,
                                         &variant_iter);
        dbus_message_iter_append_basic(&variant_iter, type, value);
        dbus_message_iter_close_container(iter, &variant_iter);
      });

  if (reply.is_error()) {
    return reply.error();
  }

  return Result<void>::ok();
}

/**
 * @brief Append an a{sv} dictionary with string values
 */
inline void
append_string_dict(DBusMessageIter *iter,
                   const std::map<std::string, std::string> &entries) {
  DBusMessageIter dict_iter;
  dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict_iter);

  for (const auto &entry : entries) {
    DBusMessageIter entry_iter, variant_iter;
    const char *key = entry.first.c_str();
    const char *value = entry.second.c_str();

    dbus_message_iter_open_container(&dict_iter, DBUS_TYPE_DICT_ENTRY, nullptr,
                                     &entry_iter);
    dbus_message_iter_append_basic(&entry_iter, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry_iter, DBUS_TYPE_VARIANT, "s",
                                     &variant_iter);
    dbus_message_iter_append_basic(&variant_iter, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&entry_iter, &variant_iter);
    dbus_message_iter_close_container(&dict_iter, &entry_iter);
  }

  dbus_message_iter_close_container(iter, &dict_iter);
}

/**
 * @brief Fetch every object BlueZ exports
 *
 * Wraps org.freedesktop.DBus.ObjectManager.GetManagedObjects, whose
 * reply has signature a{oa{sa{sv}}}.
 */
inline Result<ManagedObjects> get_managed_objects(DBusConnection *conn,
                                                  const char *dest) {
  auto reply = call_method(conn, dest, "/",
                           "org.freedesktop.DBus.ObjectManager",
                           "GetManagedObjects");
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter, objects_iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter)) {
    return Error(ErrorCode::PlatformError, "Empty reply from BlueZ");
  }

  if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
    return Error(ErrorCode::PlatformError, "Unexpected reply format");
  }

  ManagedObjects objects;
  dbus_message_iter_recurse(&iter, &objects_iter);

  while (dbus_message_iter_get_arg_type(&objects_iter) ==
         DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter object_entry, ifaces_iter;
    dbus_message_iter_recurse(&objects_iter, &object_entry);

    const char *path = nullptr;
    dbus_message_iter_get_basic(&object_entry, &path);
    dbus_message_iter_next(&object_entry);

    if (path &&
        dbus_message_iter_get_arg_type(&object_entry) == DBUS_TYPE_ARRAY) {
      InterfaceMap &ifaces = objects[path];
      dbus_message_iter_recurse(&object_entry, &ifaces_iter);

      while (dbus_message_iter_get_arg_type(&ifaces_iter) ==
             DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter iface_entry;
        dbus_message_iter_recurse(&ifaces_iter, &iface_entry);

        const char *iface = nullptr;
        dbus_message_iter_get_basic(&iface_entry, &iface);
        dbus_message_iter_next(&iface_entry);

        if (iface) {
          ifaces[iface] = read_property_dict(&iface_entry);
        }

        dbus_message_iter_next(&ifaces_iter);
      }
    }

    dbus_message_iter_next(&objects_iter);
  }

  return objects;
}

} // namespace platform
} // namespace polarlink

#endif // POLARLINK_PLATFORM_LINUX_DBUS_HELPERS_H
