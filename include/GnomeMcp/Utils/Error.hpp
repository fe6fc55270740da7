#pragma once

#include <cerrno>          // errno, EACCES, ENOENT, ...
#include <expected>        // std::{unexpected, expected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::{error_code, errc, system_category}

#include "Definitions.hpp"
#include "Types.hpp"

namespace gnome_mcp::utils {
  namespace error {
    namespace {
      using types::Exception;
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum GmcpErrorCode
     * @brief Error codes shared by configuration, routing and provider code.
     */
    enum class GmcpErrorCode : u8 {
      ApiUnavailable,     ///< A required desktop service is unavailable or failed unexpectedly at runtime.
      CapabilityNotFound, ///< The requested tool or resource is unknown or disabled.
      ConfigParseError,   ///< The configuration file is not a valid document.
      ConfigValueError,   ///< A configuration value has the wrong type or range.
      InternalError,      ///< An error occurred within the server's own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function, tool or resource.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      NotFound,           ///< A required resource (file, bus name, window, secret) was not found.
      NotSupported,       ///< The requested operation is not supported by the running desktop.
      Other,              ///< A generic or unclassified error originating from an external library.
      OutOfMemory,        ///< The system ran out of memory or resources to complete the operation.
      ParseError,         ///< Failed to parse data returned by a desktop service.
      PermissionDenied,   ///< Insufficient permissions to perform the operation.
      PlatformSpecific,   ///< An unmapped error from the underlying platform occurred (check message).
      Timeout,            ///< An operation timed out (e.g., waiting for an IPC reply).
    };

    /**
     * @struct GmcpError
     * @brief Holds structured information about an error.
     *
     * Used as the error type in Result throughout the server.
     */
    struct GmcpError {
      String               message;  ///< A descriptive error message, potentially including platform details.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      GmcpErrorCode        code;     ///< The general category of the error.

      GmcpError(const GmcpErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      explicit GmcpError(const Exception& exc, const std::source_location& loc = std::source_location::current())
        : message(exc.what()), location(loc), code(GmcpErrorCode::InternalError) {}

      explicit GmcpError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum GmcpErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error)                                                = IoError,
          is | invalid_argument                                                             = InvalidArgument,
          is | not_enough_memory                                                            = OutOfMemory,
          is | or_(operation_not_supported, not_supported)                                  = NotSupported,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | permission_denied                                                            = PermissionDenied,
          is | timed_out                                                                    = Timeout,
          is | _                                                                            = errc.category() == std::generic_category() ? InternalError : PlatformSpecific
        );
      }

      /**
       * @brief Builds an error from the current value of errno.
       * @param context Prefix describing the failed operation.
       */
      static fn fromErrno(const String& context, const std::source_location& loc = std::source_location::current()) -> GmcpError {
        using matchit::match, matchit::is, matchit::_;
        using enum GmcpErrorCode;

        const int savedErrno = errno;

        const GmcpErrorCode errc = match(savedErrno)(
          is | EACCES    = PermissionDenied,
          is | EPERM     = PermissionDenied,
          is | ENOENT    = NotFound,
          is | ETIMEDOUT = Timeout,
          is | ENOTSUP   = NotSupported,
          is | ENOMEM    = OutOfMemory,
          is | EIO       = IoError,
          is | _         = PlatformSpecific
        );

        return { errc, std::format("{}: {}", context, std::system_category().message(savedErrno)), loc };
      }
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::GmcpError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::GmcpError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace gnome_mcp::utils

namespace std {
  template <>
  struct formatter<::gnome_mcp::utils::error::GmcpErrorCode> : formatter<::gnome_mcp::utils::types::StringView> {
    template <typename FormatContext>
    fn format(gnome_mcp::utils::error::GmcpErrorCode code, FormatContext& ctx) const {
      using enum gnome_mcp::utils::error::GmcpErrorCode;
      using matchit::match, matchit::is, matchit::_;

      gnome_mcp::utils::types::StringView name = match(code)(
        is | ApiUnavailable     = "ApiUnavailable",
        is | CapabilityNotFound = "CapabilityNotFound",
        is | ConfigParseError   = "ConfigParseError",
        is | ConfigValueError   = "ConfigValueError",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | NotFound           = "NotFound",
        is | NotSupported       = "NotSupported",
        is | Other              = "Other",
        is | OutOfMemory        = "OutOfMemory",
        is | ParseError         = "ParseError",
        is | PermissionDenied   = "PermissionDenied",
        is | PlatformSpecific   = "PlatformSpecific",
        is | Timeout            = "Timeout",
        is | _                  = "Unknown"
      );

      return formatter<gnome_mcp::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::gnome_mcp::utils::types::Err(::gnome_mcp::utils::error::GmcpError(errc, msg))
#define ERR_FROM(err)           return ::gnome_mcp::utils::types::Err(::gnome_mcp::utils::error::GmcpError(err))
#define ERR_FMT(errc, fmt, ...) return ::gnome_mcp::utils::types::Err(::gnome_mcp::utils::error::GmcpError(errc, std::format(fmt, __VA_ARGS__)))
