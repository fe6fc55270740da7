#pragma once

#include <chrono>                 // std::chrono::system_clock
#include <cstdio>                 // stderr
#include <cstdlib>                // std::getenv
#include <ctime>                  // localtime_r, strftime, time_t, tm
#include <filesystem>             // std::filesystem::path
#include <format>                 // std::format
#include <ftxui/screen/color.hpp> // ftxui::Color
#include <matchit.hpp>            // matchit::{match, is}
#include <utility>                // std::forward

#include <unistd.h>               // isatty, STDERR_FILENO

#ifdef __cpp_lib_print
  #include <print> // std::println
#else
  #include <iostream> // std::cerr
#endif

#ifndef NDEBUG
  #include <source_location> // std::source_location
#endif

#include "Error.hpp"
#include "Types.hpp"

// The protocol owns stdout, so every log line goes to stderr.
namespace gnome_mcp::utils::logging {
  namespace {
    using types::Array;
    using types::LockGuard;
    using types::Mutex;
    using types::PCStr;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::usize;
  } // namespace

  inline fn GetLogMutex() -> Mutex& {
    static Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  struct LogLevelConst {
    // clang-format off
    static constexpr Array<StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr PCStr RESET_CODE   = "\033[0m";
    static constexpr PCStr BOLD_START   = "\033[1m";
    static constexpr PCStr BOLD_END     = "\033[22m";
    static constexpr PCStr ITALIC_START = "\033[3m";
    static constexpr PCStr ITALIC_END   = "\033[23m";

    static constexpr StringView DEBUG_STR = "DEBUG";
    static constexpr StringView INFO_STR  = "INFO ";
    static constexpr StringView WARN_STR  = "WARN ";
    static constexpr StringView ERROR_STR = "ERROR";

    static constexpr ftxui::Color::Palette16 DEBUG_COLOR      = ftxui::Color::Palette16::Cyan;
    static constexpr ftxui::Color::Palette16 INFO_COLOR       = ftxui::Color::Palette16::Green;
    static constexpr ftxui::Color::Palette16 WARN_COLOR       = ftxui::Color::Palette16::Yellow;
    static constexpr ftxui::Color::Palette16 ERROR_COLOR      = ftxui::Color::Palette16::Red;
    static constexpr ftxui::Color::Palette16 DEBUG_INFO_COLOR = ftxui::Color::Palette16::GrayLight;

    static constexpr PCStr TIMESTAMP_FORMAT = "%T";
    static constexpr PCStr LOG_FORMAT       = "{} {} {}";

#ifndef NDEBUG
    static constexpr PCStr FILE_LINE_FORMAT  = "{}:{}";
    static constexpr PCStr DEBUG_LINE_PREFIX = "           ╰──── ";
#endif
  };

  /// Severity, ordered so that comparisons filter against the runtime level.
  enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  inline fn GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel RuntimeLogLevel = LogLevel::Info;
    return RuntimeLogLevel;
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) {
    GetRuntimeLogLevel() = level;
  }

  /// Wraps text in the 16-color ANSI escape for an ftxui palette entry.
  inline fn Colorize(const StringView text, const ftxui::Color::Palette16& color) -> String {
    return std::format("{}{}{}", LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)), text, LogLevelConst::RESET_CODE);
  }

  inline fn Bold(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::BOLD_START, text, LogLevelConst::BOLD_END);
  }

  inline fn Italic(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::ITALIC_START, text, LogLevelConst::ITALIC_END);
  }

  /// Styled level column, indexed by LogLevel.
  inline fn GetLevelInfo() -> const Array<String, 4>& {
    static const Array<String, 4> LEVEL_INFO_INSTANCE = {
      Bold(Colorize(LogLevelConst::DEBUG_STR, LogLevelConst::DEBUG_COLOR)),
      Bold(Colorize(LogLevelConst::INFO_STR, LogLevelConst::INFO_COLOR)),
      Bold(Colorize(LogLevelConst::WARN_STR, LogLevelConst::WARN_COLOR)),
      Bold(Colorize(LogLevelConst::ERROR_STR, LogLevelConst::ERROR_COLOR)),
    };
    return LEVEL_INFO_INSTANCE;
  }

  constexpr fn GetLevelString(const LogLevel level) -> StringView {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogLevelConst::DEBUG_STR,
      is | Info  = LogLevelConst::INFO_STR,
      is | Warn  = LogLevelConst::WARN_STR,
      is | Error = LogLevelConst::ERROR_STR
    );
  }

  /**
   * @brief Whether log lines should carry ANSI styling.
   *
   * MCP clients usually capture the server's stderr into a log file, so
   * escapes are only emitted when stderr is a terminal and NO_COLOR is unset.
   */
  inline fn StderrIsStyled() -> bool {
    static const bool STYLED = isatty(STDERR_FILENO) == 1 && std::getenv("NO_COLOR") == nullptr;
    return STYLED;
  }

  /**
   * @brief Builds one log line without the trailing newline.
   * @param level Severity shown in the level column.
   * @param timestamp Wall-clock time, already formatted.
   * @param message The formatted message.
   * @param styled Whether to add ANSI color and weight.
   */
  inline fn FormatLogLine(const LogLevel level, const StringView timestamp, const StringView message, const bool styled) -> String {
    if (!styled)
      return std::format("[{}] {} {}", timestamp, GetLevelString(level), message);

    return std::format(
      LogLevelConst::LOG_FORMAT,
      Colorize(std::format("[{}]", timestamp), LogLevelConst::DEBUG_INFO_COLOR),
      GetLevelInfo().at(static_cast<usize>(level)),
      message
    );
  }

  inline fn WriteLine(const StringView text) -> void {
#ifdef __cpp_lib_print
    std::println(stderr, "{}", text);
#else
    std::cerr << text << '\n';
#endif
  }

  inline fn CurrentTimestamp() -> String {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm           local {};
    Array<char, 16>   buffer {};

    if (localtime_r(&now, &local) == nullptr || std::strftime(buffer.data(), buffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &local) == 0)
      return "??:??:??";

    return buffer.data();
  }

  /**
   * @brief Logs a message at the given level to stderr.
   *
   * Debug builds append the call site, on its own line when styled and in
   * parentheses otherwise so that captured logs stay one line per entry.
   */
  template <typename... Args>
  fn LogImpl(
    const LogLevel level,
#ifndef NDEBUG
    const std::source_location& loc,
#endif
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    if (level < GetRuntimeLogLevel())
      return;

    const bool   styled = StderrIsStyled();
    const String line   = FormatLogLine(level, CurrentTimestamp(), std::format(fmt, std::forward<Args>(args)...), styled);

#ifndef NDEBUG
    const String site = std::format(
      LogLevelConst::FILE_LINE_FORMAT, std::filesystem::path(loc.file_name()).filename().string(), loc.line()
    );
#endif

    const LockGuard lock(GetLogMutex());

#ifdef NDEBUG
    WriteLine(line);
#else
    if (styled)
      WriteLine(std::format("{}\n{}", line, Italic(Colorize(std::format("{}{}", LogLevelConst::DEBUG_LINE_PREFIX, site), LogLevelConst::DEBUG_INFO_COLOR))));
    else
      WriteLine(std::format("{} ({})", line, site));
#endif
  }

  template <typename ErrorType>
  fn LogError(const LogLevel level, const ErrorType& error_obj) {
    using DecayedErrorType = std::decay_t<ErrorType>;

#ifndef NDEBUG
    std::source_location logLocation;
#endif

    String errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::GmcpError>) {
#ifndef NDEBUG
      logLocation = error_obj.location;
#endif
      errorMessagePart = std::format("{} ({})", error_obj.message, error_obj.code);
    } else {
#ifndef NDEBUG
      logLocation = std::source_location::current();
#endif
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = error_obj.what();
      else if constexpr (requires { error_obj.message; })
        errorMessagePart = error_obj.message;
      else
        errorMessagePart = "Unknown error type logged";
    }

#ifndef NDEBUG
    LogImpl(level, logLocation, "{}", errorMessagePart);
#else
    LogImpl(level, "{}", errorMessagePart);
#endif
  }

#define debug_at(error_obj) ::gnome_mcp::utils::logging::LogError(::gnome_mcp::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::gnome_mcp::utils::logging::LogError(::gnome_mcp::utils::logging::LogLevel::Info, error_obj)
#define warn_at(error_obj)  ::gnome_mcp::utils::logging::LogError(::gnome_mcp::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::gnome_mcp::utils::logging::LogError(::gnome_mcp::utils::logging::LogLevel::Error, error_obj)

#ifdef NDEBUG
  #define debug_log(fmt, ...) ::gnome_mcp::utils::logging::LogImpl(::gnome_mcp::utils::logging::LogLevel::Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...)  ::gnome_mcp::utils::logging::LogImpl(::gnome_mcp::utils::logging::LogLevel::Info, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...)  ::gnome_mcp::utils::logging::LogImpl(::gnome_mcp::utils::logging::LogLevel::Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) ::gnome_mcp::utils::logging::LogImpl(::gnome_mcp::utils::logging::LogLevel::Error, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
  #define debug_log(fmt, ...) \
    ::gnome_mcp::utils::logging::LogImpl(::gnome_mcp::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...) \
    ::gnome_mcp::utils::logging::LogImpl(::gnome_mcp::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...) \
    ::gnome_mcp::utils::logging::LogImpl(::gnome_mcp::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) \
    ::gnome_mcp::utils::logging::LogImpl(::gnome_mcp::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#endif
} // namespace gnome_mcp::utils::logging
