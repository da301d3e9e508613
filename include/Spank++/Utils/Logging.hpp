#pragma once

#include <algorithm>                 // std::copy_n
#include <chrono>                    // std::chrono::system_clock
#include <ctime>                     // localtime_r, strftime, time_t, tm
#include <filesystem>                // std::filesystem::path
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, case_insensitive}
#include <utility>                   // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cerr
#endif

#ifndef NDEBUG
  #include <source_location> // std::source_location
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace spankpp::utils::logging {
  namespace types = ::spankpp::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes text to stderr.
   * @details Plugins run inside host daemons whose stdout may be the job's
   *          output, so console logging never touches stdout.
   * @param text The text to write
   */
  inline auto WriteToConsole(const types::StringView text) -> void {
#ifdef __cpp_lib_print
    std::print(stderr, "{}", text);
#else
    std::cerr << text;
#endif
  }

  enum class LogColor : types::u8 {
    Black         = 0,
    Red           = 1,
    Green         = 2,
    Yellow        = 3,
    Blue          = 4,
    Magenta       = 5,
    Cyan          = 6,
    White         = 7,
    Gray          = 8,
    BrightRed     = 9,
    BrightGreen   = 10,
    BrightYellow  = 11,
    BrightBlue    = 12,
    BrightMagenta = 13,
    BrightCyan    = 14,
    BrightWhite   = 15,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr const char* RESET_CODE   = "\033[0m";
    static constexpr const char* BOLD_START   = "\033[1m";
    static constexpr const char* BOLD_END     = "\033[22m";
    static constexpr const char* ITALIC_START = "\033[3m";
    static constexpr const char* ITALIC_END   = "\033[23m";

    // BOLD_START + COLOR + TEXT + RESET_CODE, string literals so they outlive static destruction
    static constexpr types::StringView DEBUG3_STYLED  = "\033[1m\033[38;5;8mDEBUG3\033[0m";  // Gray
    static constexpr types::StringView DEBUG2_STYLED  = "\033[1m\033[38;5;8mDEBUG2\033[0m";  // Gray
    static constexpr types::StringView DEBUG_STYLED   = "\033[1m\033[38;5;6mDEBUG \033[0m";  // Cyan
    static constexpr types::StringView VERBOSE_STYLED = "\033[1m\033[38;5;4mVERB  \033[0m";  // Blue
    static constexpr types::StringView INFO_STYLED    = "\033[1m\033[38;5;2mINFO  \033[0m";  // Green
    static constexpr types::StringView ERROR_STYLED   = "\033[1m\033[38;5;1mERROR \033[0m";  // Red

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%X";
    static constexpr types::PCStr LOG_FORMAT       = "{} {} {}";

#ifndef NDEBUG
    static constexpr types::PCStr FILE_LINE_FORMAT  = "{}:{}";
    static constexpr types::PCStr DEBUG_LINE_PREFIX = "            ╰──── ";
#endif
  };

  /**
   * @enum LogLevel
   * @brief Severities understood by the host, from most to least verbose.
   */
  enum class LogLevel : types::u8 {
    Debug3,
    Debug2,
    Debug,
    Verbose,
    Info,
    Error,
  };

  /**
   * @brief Parses a level name such as "debug2" or "INFO".
   * @return The level, or None for an unknown name.
   */
  inline auto ParseLogLevel(const types::StringView name) -> types::Option<LogLevel> {
    return magic_enum::enum_cast<LogLevel>(name, magic_enum::case_insensitive);
  }

  /**
   * @brief Gets the current runtime log level.
   * @return Reference to the process-wide log level.
   */
  inline auto GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  /**
   * @brief Sets the runtime log level.
   * @param level The new log level to set.
   */
  inline auto SetRuntimeLogLevel(const LogLevel level) {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @brief Destination for formatted log records.
   * @details When no sink is installed records are written to the console.
   */
  using LogSink = void (*)(LogLevel level, types::StringView message);

  inline auto GetLogSinkStorage() -> LogSink& {
    static LogSink Sink = nullptr;
    return Sink;
  }

  /**
   * @brief Installs @p sink as the destination for every later record.
   * @param sink The sink, or nullptr to go back to console output.
   */
  inline auto SetLogSink(LogSink sink) -> void {
    const types::LockGuard lock(GetLogMutex());
    GetLogSinkStorage() = sink;
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White; ///< Optional color to apply
    bool     bold   = false;           ///< Whether to make text bold
    bool     italic = false;           ///< Whether to make text italic
  };

  /**
   * @brief Applies ANSI styling to text based on the provided style options.
   * @param text The text to style
   * @param style The style options (color, bold, italic)
   * @return Styled string with ANSI codes
   */
  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 24);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  /**
   * @brief Returns the pre-formatted and styled log level strings.
   */
  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 6>& {
    static constexpr types::Array<types::StringView, 6> LEVEL_INFO_INSTANCE = {
      LogLevelConst::DEBUG3_STYLED,
      LogLevelConst::DEBUG2_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::VERBOSE_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::ERROR_STYLED,
    };

    return LEVEL_INFO_INSTANCE;
  }

  /**
   * @brief Returns a HH:MM:SS timestamp string for the provided epoch time.
   *        The value is cached per-thread and only recomputed when the seconds
   *        value changes.
   * @param timeT The epoch time (seconds since epoch).
   * @return StringView pointing to a thread-local null-terminated buffer.
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                  LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 9> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (localtime_r(&timeT, &localTm) != nullptr) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("??:??:??", 9, TsBuffer.data());
      } else
        std::copy_n("??:??:??", 9, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 8 };
  }

  /**
   * @brief Logs a message with the specified log level, source location, and format string.
   * @tparam Args Parameter pack for format arguments.
   * @param level The log level.
   * @param loc The source location of the log message (only in Debug builds).
   * @param fmt The format string.
   * @param args The arguments for the format string.
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel level,
#ifndef NDEBUG
    const std::source_location& loc,
#endif
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using namespace std::chrono;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const types::String message = std::format(fmt, std::forward<Args>(args)...);

    const types::LockGuard lock(GetLogMutex());

    // The host stamps its own records
    if (LogSink sink = GetLogSinkStorage()) {
      sink(level, message);
      return;
    }

    const types::StringView timestamp        = GetCachedTimestamp(system_clock::to_time_t(system_clock::now()));
    const types::String     coloredTimestamp = Stylize(std::format("[{}]", timestamp), { .color = LogColor::White });

    WriteToConsole(std::format(
      "{}\n",
      std::format(LogLevelConst::LOG_FORMAT, coloredTimestamp, GetLevelInfo().at(static_cast<types::usize>(level)), message)
    ));

#ifndef NDEBUG
    const types::String fileLine = std::format(LogLevelConst::FILE_LINE_FORMAT, path(loc.file_name()).lexically_normal().string(), loc.line());

    WriteToConsole(Stylize(std::format("{}{}", LogLevelConst::DEBUG_LINE_PREFIX, fileLine), { .color = LogColor::White, .italic = true }));
    WriteToConsole(std::format("{}\n", LogLevelConst::RESET_CODE));
#endif
  }

  template <typename ErrorType>
  auto LogError(const LogLevel level, const ErrorType& error_obj) {
    using DecayedErrorType = std::decay_t<ErrorType>;

#ifndef NDEBUG
    std::source_location logLocation;
#endif

    types::String errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::SpankError>) {
#ifndef NDEBUG
      logLocation = error_obj.location;
#endif
      errorMessagePart = error_obj.chain();
    } else {
#ifndef NDEBUG
      logLocation = std::source_location::current();
#endif
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = error_obj.what();
      else
        errorMessagePart = "Unknown error type logged";
    }

#ifndef NDEBUG
    LogImpl(level, logLocation, "{}", errorMessagePart);
#else
    LogImpl(level, "{}", errorMessagePart);
#endif
  }

#define debug_at(error_obj) ::spankpp::utils::logging::LogError(::spankpp::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::spankpp::utils::logging::LogError(::spankpp::utils::logging::LogLevel::Info, error_obj)
#define error_at(error_obj) ::spankpp::utils::logging::LogError(::spankpp::utils::logging::LogLevel::Error, error_obj)

#ifdef NDEBUG
  #define debug3_log(fmt, ...)  ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Debug3, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define debug2_log(fmt, ...)  ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Debug2, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define debug_log(fmt, ...)   ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define verbose_log(fmt, ...) ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Verbose, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...)    ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Info, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...)   ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Error, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
  #define debug3_log(fmt, ...) \
    ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Debug3, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define debug2_log(fmt, ...) \
    ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Debug2, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define debug_log(fmt, ...) \
    ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define verbose_log(fmt, ...) \
    ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Verbose, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...) \
    ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) \
    ::spankpp::utils::logging::LogImpl(::spankpp::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#endif
} // namespace spankpp::utils::logging
