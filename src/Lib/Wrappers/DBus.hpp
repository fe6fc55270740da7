#pragma once

#ifdef __linux__

// clang-format off
#include <chrono>      // std::chrono::{steady_clock, milliseconds, duration_cast}
#include <cstring>     // std::strcmp
#include <dbus/dbus.h> // DBus Library
#include <format>      // std::format
#include <tuple>       // std::{tuple, apply}
#include <type_traits> // std::{decay_t, is_same_v}
#include <utility>     // std::{exchange, forward}
#include <variant>     // std::{variant, visit}

#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"
// clang-format on

namespace DBus {
  namespace {
    using gnome_mcp::utils::error::GmcpError;
    using gnome_mcp::utils::error::GmcpErrorCode;
    using gnome_mcp::utils::types::Err;
    using gnome_mcp::utils::types::f64;
    using gnome_mcp::utils::types::Fn;
    using gnome_mcp::utils::types::i32;
    using gnome_mcp::utils::types::i64;
    using gnome_mcp::utils::types::Map;
    using gnome_mcp::utils::types::None;
    using gnome_mcp::utils::types::Option;
    using gnome_mcp::utils::types::PCStr;
    using gnome_mcp::utils::types::Result;
    using gnome_mcp::utils::types::String;
    using gnome_mcp::utils::types::u32;
    using gnome_mcp::utils::types::u64;
    using gnome_mcp::utils::types::u8;
    using gnome_mcp::utils::types::Vec;

    template <typename>
    constexpr bool IS_TUPLE = false;

    template <typename... Ts>
    constexpr bool IS_TUPLE<std::tuple<Ts...>> = true;
  } // namespace

  /// An `o` argument, kept apart from plain strings so it gets the right wire type.
  struct ObjectPath {
    String value;
  };

  using StringList     = Vec<String>;     ///< as
  using ObjectPathList = Vec<ObjectPath>; ///< ao
  using ByteArray  = Vec<u8>;             ///< ay
  using StringDict = Map<String, String>; ///< a{ss}

  /// The values this server ever wraps in a `v`.
  using BasicValue = std::variant<bool, i32, u32, i64, u64, f64, String, ObjectPath, StringDict>;

  /// A `v` argument.
  struct Variant {
    BasicValue value;
  };

  using VariantDict = Map<String, BasicValue>; ///< a{sv}

  /**
   * @brief Maps a D-Bus error name onto the server's error codes.
   */
  inline fn MapErrorName(PCStr name) -> GmcpErrorCode {
    if (!name)
      return GmcpErrorCode::PlatformSpecific;

    if (std::strcmp(name, DBUS_ERROR_TIMEOUT) == 0 || std::strcmp(name, DBUS_ERROR_NO_REPLY) == 0 ||
        std::strcmp(name, DBUS_ERROR_TIMED_OUT) == 0)
      return GmcpErrorCode::Timeout;

    if (std::strcmp(name, DBUS_ERROR_SERVICE_UNKNOWN) == 0 || std::strcmp(name, DBUS_ERROR_NAME_HAS_NO_OWNER) == 0)
      return GmcpErrorCode::NotFound;

    if (std::strcmp(name, DBUS_ERROR_ACCESS_DENIED) == 0 || std::strcmp(name, DBUS_ERROR_AUTH_FAILED) == 0)
      return GmcpErrorCode::PermissionDenied;

    if (std::strcmp(name, DBUS_ERROR_UNKNOWN_METHOD) == 0)
      return GmcpErrorCode::NotSupported;

    return GmcpErrorCode::PlatformSpecific;
  }

  /**
   * @brief RAII wrapper for DBusError. Automatically initializes and frees.
   */
  class Error {
    DBusError m_err {};
    bool      m_isInitialized = false;

   public:
    Error() : m_isInitialized(true) { dbus_error_init(&m_err); }

    ~Error() {
      if (m_isInitialized)
        dbus_error_free(&m_err);
    }

    Error(const Error&)                = delete;
    fn operator=(const Error&)->Error& = delete;
    Error(Error&&)                     = delete;
    fn operator=(Error&&)->Error&      = delete;

    /**
     * @brief Checks if the D-Bus error is set.
     */
    [[nodiscard]] fn isSet() const -> bool { return m_isInitialized && dbus_error_is_set(&m_err); }

    /**
     * @brief Gets the error message, or "" if not set.
     */
    [[nodiscard]] fn message() const -> PCStr { return isSet() ? m_err.message : ""; }

    /**
     * @brief Gets the error name (e.g. "org.freedesktop.DBus.Error.Failed"), or "" if not set.
     */
    [[nodiscard]] fn name() const -> PCStr { return isSet() ? m_err.name : ""; }

    [[nodiscard]] fn get() -> DBusError* { return &m_err; }

    /**
     * @brief Converts the D-Bus error to a GmcpError, picking the code from the error name.
     */
    [[nodiscard]] fn toGmcpError() const -> GmcpError {
      if (isSet())
        return { MapErrorName(name()), std::format("D-Bus Error: {} ({})", message(), name()) };

      return { GmcpErrorCode::InternalError, "Attempted to convert non-set D-Bus error" };
    }
  };

  /**
   * @brief Wrapper for DBusMessageIter.
   * Note: This wrapper does *not* own the message, only the iterator state.
   * It must not outlive the Message it was created from.
   */
  class MessageIter {
    DBusMessageIter m_iter {};
    bool            m_isValid = false;

    explicit MessageIter(const DBusMessageIter& iter, const bool isValid) : m_iter(iter), m_isValid(isValid) {}

    friend class Message;

    fn getBasic(void* value) -> void {
      if (m_isValid)
        dbus_message_iter_get_basic(&m_iter, value);
    }

   public:
    MessageIter(const MessageIter&)                = delete;
    fn operator=(const MessageIter&)->MessageIter& = delete;
    MessageIter(MessageIter&&)                     = delete;
    fn operator=(MessageIter&&)->MessageIter&      = delete;
    ~MessageIter()                                 = default;

    [[nodiscard]] fn isValid() const -> bool { return m_isValid; }

    /**
     * @brief Gets the D-Bus type code of the current argument, or DBUS_TYPE_INVALID.
     */
    [[nodiscard]] fn getArgType() -> int {
      return m_isValid ? dbus_message_iter_get_arg_type(&m_iter) : DBUS_TYPE_INVALID;
    }

    [[nodiscard]] fn getElementType() -> int {
      return m_isValid ? dbus_message_iter_get_element_type(&m_iter) : DBUS_TYPE_INVALID;
    }

    /**
     * @brief Advances the iterator to the next argument.
     * @return True if it moved to a next element.
     */
    fn next() -> bool { return m_isValid && dbus_message_iter_next(&m_iter); }

    /**
     * @brief Recurses into a container-type argument (array, struct, dict entry, variant).
     * The returned iterator is invalid if the current element is not a container.
     */
    [[nodiscard]] fn recurse() -> MessageIter {
      const int type = getArgType();

      if (type != DBUS_TYPE_ARRAY && type != DBUS_TYPE_STRUCT && type != DBUS_TYPE_DICT_ENTRY && type != DBUS_TYPE_VARIANT)
        return MessageIter({}, false);

      DBusMessageIter subIter;
      dbus_message_iter_recurse(&m_iter, &subIter);

      return MessageIter(subIter, true);
    }

    /**
     * @brief Gets a string or object path argument.
     */
    [[nodiscard]] fn getString() -> Option<String> {
      const int type = getArgType();

      if (type == DBUS_TYPE_VARIANT) {
        MessageIter inner = recurse();
        return inner.getString();
      }

      if (type == DBUS_TYPE_STRING || type == DBUS_TYPE_OBJECT_PATH || type == DBUS_TYPE_SIGNATURE) {
        PCStr strPtr = nullptr;

        getBasic(static_cast<void*>(&strPtr));

        if (strPtr)
          return String(strPtr);
      }

      return None;
    }

    [[nodiscard]] fn getBool() -> Option<bool> {
      const int type = getArgType();

      if (type == DBUS_TYPE_VARIANT) {
        MessageIter inner = recurse();
        return inner.getBool();
      }

      if (type != DBUS_TYPE_BOOLEAN)
        return None;

      dbus_bool_t value = FALSE;
      getBasic(&value);

      return value != FALSE;
    }

    /**
     * @brief Gets any integer argument, widened to i64.
     */
    [[nodiscard]] fn getInteger() -> Option<i64> {
      switch (getArgType()) {
        case DBUS_TYPE_VARIANT: {
          MessageIter inner = recurse();
          return inner.getInteger();
        }
        case DBUS_TYPE_BYTE: {
          u8 value = 0;
          getBasic(&value);
          return value;
        }
        case DBUS_TYPE_INT16: {
          dbus_int16_t value = 0;
          getBasic(&value);
          return value;
        }
        case DBUS_TYPE_UINT16: {
          dbus_uint16_t value = 0;
          getBasic(&value);
          return value;
        }
        case DBUS_TYPE_INT32: {
          dbus_int32_t value = 0;
          getBasic(&value);
          return value;
        }
        case DBUS_TYPE_UINT32: {
          dbus_uint32_t value = 0;
          getBasic(&value);
          return value;
        }
        case DBUS_TYPE_INT64: {
          dbus_int64_t value = 0;
          getBasic(&value);
          return value;
        }
        case DBUS_TYPE_UINT64: {
          dbus_uint64_t value = 0;
          getBasic(&value);
          return static_cast<i64>(value);
        }
        default: return None;
      }
    }

    [[nodiscard]] fn getDouble() -> Option<f64> {
      const int type = getArgType();

      if (type == DBUS_TYPE_VARIANT) {
        MessageIter inner = recurse();
        return inner.getDouble();
      }

      if (type == DBUS_TYPE_DOUBLE) {
        double value = 0;
        getBasic(&value);
        return value;
      }

      if (Option<i64> integer = getInteger())
        return static_cast<f64>(*integer);

      return None;
    }

    /**
     * @brief Reads an array of strings or object paths (as, ao).
     */
    [[nodiscard]] fn getStringList() -> StringList {
      StringList out;

      if (getArgType() == DBUS_TYPE_VARIANT) {
        MessageIter inner = recurse();
        return inner.getStringList();
      }

      if (getArgType() != DBUS_TYPE_ARRAY)
        return out;

      MessageIter items = recurse();

      if (items.getArgType() == DBUS_TYPE_INVALID)
        return out;

      do {
        if (Option<String> item = items.getString())
          out.push_back(std::move(*item));
      } while (items.next());

      return out;
    }

    /**
     * @brief Reads an array of bytes (ay).
     */
    [[nodiscard]] fn getBytes() -> ByteArray {
      if (getArgType() != DBUS_TYPE_ARRAY || getElementType() != DBUS_TYPE_BYTE)
        return {};

      MessageIter items = recurse();

      const u8* data  = nullptr;
      int       count = 0;

      dbus_message_iter_get_fixed_array(&items.m_iter, static_cast<void*>(&data), &count);

      if (!data || count <= 0)
        return {};

      return { data, data + count }; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    /**
     * @brief Walks a dictionary (a{sv}, a{ss}, a{oa{sa{sv}}}...).
     * The callback receives each key and an iterator positioned on the value,
     * with a variant value already unwrapped.
     */
    fn forEachEntry(const Fn<void(const String&, MessageIter&)>& callback) -> void {
      if (getArgType() == DBUS_TYPE_VARIANT) {
        MessageIter inner = recurse();
        inner.forEachEntry(callback);
        return;
      }

      if (getArgType() != DBUS_TYPE_ARRAY || getElementType() != DBUS_TYPE_DICT_ENTRY)
        return;

      MessageIter entries = recurse();

      if (entries.getArgType() == DBUS_TYPE_INVALID)
        return;

      do {
        MessageIter entry = entries.recurse();

        const Option<String> key = entry.getString();

        if (!key || !entry.next())
          continue;

        if (entry.getArgType() == DBUS_TYPE_VARIANT) {
          MessageIter value = entry.recurse();
          callback(*key, value);
        } else
          callback(*key, entry);
      } while (entries.next());
    }
  };

  /**
   * @brief RAII wrapper for DBusMessage. Automatically unrefs.
   */
  class Message {
    DBusMessage* m_msg = nullptr;

   public:
    explicit Message(DBusMessage* msg = nullptr) : m_msg(msg) {}

    ~Message() {
      if (m_msg)
        dbus_message_unref(m_msg);
    }

    Message(const Message&)                = delete;
    fn operator=(const Message&)->Message& = delete;

    Message(Message&& other) noexcept : m_msg(std::exchange(other.m_msg, nullptr)) {}

    fn operator=(Message&& other) noexcept -> Message& {
      if (this != &other) {
        if (m_msg)
          dbus_message_unref(m_msg);
        m_msg = std::exchange(other.m_msg, nullptr);
      }
      return *this;
    }

    [[nodiscard]] fn get() const -> DBusMessage* { return m_msg; }

    /**
     * @brief Initializes a message iterator for reading arguments from this message.
     * @return A MessageIter. Check iter.isValid() before use.
     */
    [[nodiscard]] fn iterInit() const -> MessageIter {
      if (!m_msg)
        return MessageIter({}, false);

      DBusMessageIter iter;
      const bool      isValid = dbus_message_iter_init(m_msg, &iter);
      return MessageIter(iter, isValid);
    }

    /**
     * @brief Checks whether this message is the given signal.
     */
    [[nodiscard]] fn isSignal(PCStr interface, PCStr member) const -> bool {
      return m_msg && dbus_message_is_signal(m_msg, interface, member);
    }

    [[nodiscard]] fn path() const -> String {
      PCStr value = m_msg ? dbus_message_get_path(m_msg) : nullptr;
      return value ? String(value) : String();
    }

    /**
     * @brief Appends arguments to the message.
     * Supported: bool, i32, u32, i64, u64, f64, strings, ObjectPath, StringList,
     * ObjectPathList, ByteArray, StringDict, VariantDict, Variant and std::tuple (as a struct).
     * @return True if all arguments were appended successfully.
     */
    template <typename... Args>
    [[nodiscard]] fn appendArgs(Args&&... args) -> bool {
      if (!m_msg)
        return false;

      DBusMessageIter iter;
      dbus_message_iter_init_append(m_msg, &iter);

      bool success = true;
      ((success = success && appendArg(iter, std::forward<Args>(args))), ...); // NOLINT
      return success;
    }

    /**
     * @brief Creates a new D-Bus method call message.
     * @param destination Service name (e.g., "org.freedesktop.Notifications").
     * @param path Object path (e.g., "/org/freedesktop/Notifications").
     * @param interface Interface name (e.g., "org.freedesktop.Notifications").
     * @param method Method name (e.g., "Notify").
     */
    static fn newMethodCall(PCStr destination, PCStr path, PCStr interface, PCStr method) -> Result<Message> {
      DBusMessage* rawMsg = dbus_message_new_method_call(destination, path, interface, method);

      if (!rawMsg)
        return Err(GmcpError(GmcpErrorCode::OutOfMemory, "dbus_message_new_method_call failed (allocation failed?)"));

      return Message(rawMsg);
    }

   private:
    static fn appendString(DBusMessageIter& iter, const int type, const String& value) -> bool {
      PCStr valuePtr = value.c_str();
      return dbus_message_iter_append_basic(&iter, type, static_cast<const void*>(&valuePtr));
    }

    static fn signatureOf(const BasicValue& value) -> PCStr {
      return std::visit(
        []<typename T>(const T&) -> PCStr {
          if constexpr (std::is_same_v<T, bool>)
            return DBUS_TYPE_BOOLEAN_AS_STRING;
          else if constexpr (std::is_same_v<T, i32>)
            return DBUS_TYPE_INT32_AS_STRING;
          else if constexpr (std::is_same_v<T, u32>)
            return DBUS_TYPE_UINT32_AS_STRING;
          else if constexpr (std::is_same_v<T, i64>)
            return DBUS_TYPE_INT64_AS_STRING;
          else if constexpr (std::is_same_v<T, u64>)
            return DBUS_TYPE_UINT64_AS_STRING;
          else if constexpr (std::is_same_v<T, f64>)
            return DBUS_TYPE_DOUBLE_AS_STRING;
          else if constexpr (std::is_same_v<T, String>)
            return DBUS_TYPE_STRING_AS_STRING;
          else if constexpr (std::is_same_v<T, ObjectPath>)
            return DBUS_TYPE_OBJECT_PATH_AS_STRING;
          else
            return "a{ss}";
        },
        value
      );
    }

    template <typename T>
    static fn appendArg(DBusMessageIter& iter, T&& arg) -> bool {
      using DecayedT = std::decay_t<T>;

      if constexpr (std::is_same_v<DecayedT, bool>) {
        const dbus_bool_t value = arg ? TRUE : FALSE;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_BOOLEAN, &value);
      } else if constexpr (std::is_same_v<DecayedT, i32>) {
        const dbus_int32_t value = arg;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_INT32, &value);
      } else if constexpr (std::is_same_v<DecayedT, u32>) {
        const dbus_uint32_t value = arg;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &value);
      } else if constexpr (std::is_same_v<DecayedT, i64>) {
        const dbus_int64_t value = arg;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_INT64, &value);
      } else if constexpr (std::is_same_v<DecayedT, u64>) {
        const dbus_uint64_t value = arg;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT64, &value);
      } else if constexpr (std::is_same_v<DecayedT, f64>) {
        const double value = arg;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_DOUBLE, &value);
      } else if constexpr (std::is_same_v<DecayedT, String>) {
        return appendString(iter, DBUS_TYPE_STRING, arg);
      } else if constexpr (std::is_convertible_v<DecayedT, PCStr>) {
        PCStr valuePtr = static_cast<PCStr>(arg);
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, static_cast<const void*>(&valuePtr));
      } else if constexpr (std::is_same_v<DecayedT, ObjectPath>) {
        return appendString(iter, DBUS_TYPE_OBJECT_PATH, arg.value);
      } else if constexpr (std::is_same_v<DecayedT, StringList>) {
        DBusMessageIter sub;

        if (!dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, DBUS_TYPE_STRING_AS_STRING, &sub))
          return false;

        bool success = true;

        for (const String& item : arg)
          success = success && appendString(sub, DBUS_TYPE_STRING, item);

        return dbus_message_iter_close_container(&iter, &sub) && success;
      } else if constexpr (std::is_same_v<DecayedT, ObjectPathList>) {
        DBusMessageIter sub;

        if (!dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, DBUS_TYPE_OBJECT_PATH_AS_STRING, &sub))
          return false;

        bool success = true;

        for (const ObjectPath& item : arg)
          success = success && appendString(sub, DBUS_TYPE_OBJECT_PATH, item.value);

        return dbus_message_iter_close_container(&iter, &sub) && success;
      } else if constexpr (std::is_same_v<DecayedT, ByteArray>) {
        DBusMessageIter sub;

        if (!dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, DBUS_TYPE_BYTE_AS_STRING, &sub))
          return false;

        const u8* data = arg.data();

        const bool success = dbus_message_iter_append_fixed_array(&sub, DBUS_TYPE_BYTE, static_cast<const void*>(&data), static_cast<int>(arg.size()));

        return dbus_message_iter_close_container(&iter, &sub) && success;
      } else if constexpr (std::is_same_v<DecayedT, StringDict>) {
        DBusMessageIter sub;

        if (!dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{ss}", &sub))
          return false;

        bool success = true;

        for (const auto& [key, value] : arg) {
          DBusMessageIter entry;

          if (!dbus_message_iter_open_container(&sub, DBUS_TYPE_DICT_ENTRY, nullptr, &entry))
            return false;

          success = success && appendString(entry, DBUS_TYPE_STRING, key) && appendString(entry, DBUS_TYPE_STRING, value);
          success = dbus_message_iter_close_container(&sub, &entry) && success;
        }

        return dbus_message_iter_close_container(&iter, &sub) && success;
      } else if constexpr (std::is_same_v<DecayedT, VariantDict>) {
        DBusMessageIter sub;

        if (!dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &sub))
          return false;

        bool success = true;

        for (const auto& [key, value] : arg) {
          DBusMessageIter entry;

          if (!dbus_message_iter_open_container(&sub, DBUS_TYPE_DICT_ENTRY, nullptr, &entry))
            return false;

          success = success && appendString(entry, DBUS_TYPE_STRING, key) && appendArg(entry, Variant { value });
          success = dbus_message_iter_close_container(&sub, &entry) && success;
        }

        return dbus_message_iter_close_container(&iter, &sub) && success;
      } else if constexpr (std::is_same_v<DecayedT, Variant>) {
        DBusMessageIter sub;

        if (!dbus_message_iter_open_container(&iter, DBUS_TYPE_VARIANT, signatureOf(arg.value), &sub))
          return false;

        const bool success = std::visit([&sub](const auto& value) -> bool { return appendArg(sub, value); }, arg.value);

        return dbus_message_iter_close_container(&iter, &sub) && success;
      } else if constexpr (IS_TUPLE<DecayedT>) {
        DBusMessageIter sub;

        if (!dbus_message_iter_open_container(&iter, DBUS_TYPE_STRUCT, nullptr, &sub))
          return false;

        const bool success = std::apply([&sub](const auto&... fields) -> bool { return (appendArg(sub, fields) && ...); }, arg);

        return dbus_message_iter_close_container(&iter, &sub) && success;
      } else {
        static_assert(!sizeof(T*), "Unsupported type passed to appendArgs");
        return false;
      }
    }
  };

  /**
   * @brief RAII wrapper for DBusConnection. Automatically unrefs.
   */
  class Connection {
    DBusConnection* m_conn = nullptr;

   public:
    explicit Connection(DBusConnection* conn = nullptr) : m_conn(conn) {}

    ~Connection() {
      if (m_conn)
        dbus_connection_unref(m_conn);
    }

    Connection(const Connection&)                = delete;
    fn operator=(const Connection&)->Connection& = delete;

    Connection(Connection&& other) noexcept : m_conn(std::exchange(other.m_conn, nullptr)) {}

    fn operator=(Connection&& other) noexcept -> Connection& {
      if (this != &other) {
        if (m_conn)
          dbus_connection_unref(m_conn);

        m_conn = std::exchange(other.m_conn, nullptr);
      }
      return *this;
    }

    [[nodiscard]] fn get() const -> DBusConnection* { return m_conn; }

    /**
     * @brief Gets this connection's unique bus name (e.g. ":1.42").
     */
    [[nodiscard]] fn uniqueName() const -> String {
      PCStr name = m_conn ? dbus_bus_get_unique_name(m_conn) : nullptr;
      return name ? String(name) : String();
    }

    /**
     * @brief Sends a message and waits for a reply, blocking execution.
     * @param message The D-Bus message to send.
     * @param timeoutMs Timeout duration in milliseconds.
     */
    [[nodiscard]] fn sendWithReplyAndBlock(const Message& message, const i32 timeoutMs) const -> Result<Message> {
      if (!m_conn || !message.get())
        return Err(GmcpError(GmcpErrorCode::InvalidArgument, "Invalid connection or message provided to sendWithReplyAndBlock"));

      Error        err;
      DBusMessage* rawReply = dbus_connection_send_with_reply_and_block(m_conn, message.get(), timeoutMs, err.get());

      if (err.isSet())
        return Err(err.toGmcpError());

      if (!rawReply)
        return Err(GmcpError(
          GmcpErrorCode::ApiUnavailable,
          "dbus_connection_send_with_reply_and_block returned null without setting error (likely timeout or disconnected)"
        ));

      return Message(rawReply);
    }

    /**
     * @brief Builds a method call, appends the arguments and waits for the reply.
     */
    template <typename... Args>
    [[nodiscard]] fn call(PCStr destination, PCStr path, PCStr interface, PCStr method, const i32 timeoutMs, Args&&... args) const
      -> Result<Message> {
      Result<Message> message = Message::newMethodCall(destination, path, interface, method);

      if (!message)
        return Err(message.error());

      if (!message->appendArgs(std::forward<Args>(args)...))
        return Err(GmcpError(GmcpErrorCode::OutOfMemory, std::format("Failed to append arguments for {}.{}", interface, method)));

      return sendWithReplyAndBlock(*message, timeoutMs);
    }

    /**
     * @brief Reads a property through org.freedesktop.DBus.Properties.Get.
     * The reply holds a single variant; unwrap it with iterInit().recurse().
     */
    [[nodiscard]] fn getProperty(PCStr destination, PCStr path, PCStr interface, PCStr property, const i32 timeoutMs) const
      -> Result<Message> {
      return call(destination, path, DBUS_INTERFACE_PROPERTIES, "Get", timeoutMs, interface, property);
    }

    /**
     * @brief Writes a property through org.freedesktop.DBus.Properties.Set.
     */
    [[nodiscard]] fn setProperty(PCStr destination, PCStr path, PCStr interface, PCStr property, BasicValue value, const i32 timeoutMs) const
      -> Result<> {
      Result<Message> reply = call(destination, path, DBUS_INTERFACE_PROPERTIES, "Set", timeoutMs, interface, property, Variant { std::move(value) });

      if (!reply)
        return Err(reply.error());

      return {};
    }

    /**
     * @brief Subscribes this connection to messages matching a rule.
     */
    [[nodiscard]] fn addMatch(const String& rule) const -> Result<> {
      Error err;

      dbus_bus_add_match(m_conn, rule.c_str(), err.get());

      if (err.isSet())
        return Err(err.toGmcpError());

      return {};
    }

    fn removeMatch(const String& rule) const -> void {
      dbus_bus_remove_match(m_conn, rule.c_str(), nullptr);
    }

    /**
     * @brief Waits for a signal that satisfies the predicate.
     * The caller must have added a match rule for it beforehand.
     * @return The first matching signal, or a Timeout error.
     */
    [[nodiscard]] fn waitForSignal(PCStr interface, PCStr member, const Fn<bool(const Message&)>& predicate, const i32 timeoutMs) const
      -> Result<Message> {
      using std::chrono::steady_clock, std::chrono::milliseconds, std::chrono::duration_cast;

      const steady_clock::time_point deadline = steady_clock::now() + milliseconds(timeoutMs);

      while (true) {
        while (DBusMessage* raw = dbus_connection_pop_message(m_conn)) {
          Message message(raw);

          if (message.isSignal(interface, member) && predicate(message))
            return message;
        }

        const i64 remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();

        if (remaining <= 0)
          return Err(GmcpError(GmcpErrorCode::Timeout, std::format("Timed out waiting for {}.{}", interface, member)));

        if (!dbus_connection_read_write(m_conn, static_cast<int>(remaining)))
          return Err(GmcpError(GmcpErrorCode::ApiUnavailable, "D-Bus connection closed while waiting for a signal"));
      }
    }

    /**
     * @brief Connects to a D-Bus bus type (Session or System).
     */
    static fn busGet(const DBusBusType busType) -> Result<Connection> {
      Error           err;
      DBusConnection* rawConn = dbus_bus_get(busType, err.get());

      if (err.isSet())
        return Err(GmcpError(GmcpErrorCode::ApiUnavailable, std::format("D-Bus Error: {} ({})", err.message(), err.name())));

      if (!rawConn)
        return Err(GmcpError(GmcpErrorCode::ApiUnavailable, "dbus_bus_get returned null without setting error"));

      dbus_connection_set_exit_on_disconnect(rawConn, FALSE);

      return Connection(rawConn);
    }
  };
} // namespace DBus

#endif // __linux__
