#pragma once

#include <chrono>     // std::chrono::system_clock
#include <ctime>      // localtime_r, strftime, time_t, tm
#include <filesystem> // std::filesystem::path
#include <format>     // std::format
#include <utility>    // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include <source_location> // std::source_location

#include "Error.hpp"
#include "Types.hpp"

namespace distro::utils::logging {
  namespace types = ::distro::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes text to stdout or stderr.
   */
  inline auto WriteToConsole(const types::StringView text, bool useStderr = false) -> void {
#ifdef __cpp_lib_print
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
#else
    if (useStderr)
      std::cerr << text;
    else
      std::cout << text;
#endif
  }

  enum class LogColor : types::u8 {
    Black   = 0,
    Red     = 1,
    Green   = 2,
    Yellow  = 3,
    Blue    = 4,
    Magenta = 5,
    Cyan    = 6,
    White   = 7,
    Gray    = 8,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 9> COLOR_CODE_LITERALS = {
      "\033[38;5;0m", "\033[38;5;1m", "\033[38;5;2m",
      "\033[38;5;3m", "\033[38;5;4m", "\033[38;5;5m",
      "\033[38;5;6m", "\033[38;5;7m", "\033[38;5;8m",
    };
    // clang-format on

    static constexpr const char* RESET_CODE   = "\033[0m";
    static constexpr const char* BOLD_START   = "\033[1m";
    static constexpr const char* ITALIC_START = "\033[3m";
    static constexpr const char* DIM_START    = "\033[2m";

    // Tracing-style colors: TRACE=magenta, DEBUG=blue, INFO=green, WARN=yellow, ERROR=red
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Log levels, most verbose first.
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  /**
   * @brief Gets the current runtime log level.
   */
  inline auto GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  /**
   * @brief Sets the runtime log level.
   */
  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 32);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  constexpr auto ShouldUseStderr(const LogLevel level) -> bool {
    return level == LogLevel::Warn || level == LogLevel::Error;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Print Helpers
  // ─────────────────────────────────────────────────────────────────────────────

  inline auto Print(const LogLevel level, const types::StringView text) {
    WriteToConsole(text, ShouldUseStderr(level));
  }

  inline auto Println(const LogLevel level) {
    WriteToConsole("\n", ShouldUseStderr(level));
  }

  // User-facing print (stdout only)
  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  inline auto Print(const types::StringView text) {
    WriteToConsole(text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  inline auto Println(const types::StringView text) {
    types::String textWithNewline(text);
    textWithNewline += '\n';
    WriteToConsole(textWithNewline);
  }

  inline auto Println() {
    WriteToConsole("\n");
  }

  /**
   * @brief Returns a ISO8601-like timestamp string (YYYY-MM-DDTHH:MM:SS).
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (localtime_r(&timeT, &localTm) != nullptr) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());
      } else
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Structured Fields
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @struct Field
   * @brief A key-value pair attached to a log line.
   */
  struct Field {
    types::StringView key;
    types::String     value;

    template <typename T>
    static auto create(types::StringView k, const T& v) -> Field {
      if constexpr (std::is_same_v<std::decay_t<T>, types::String> || std::is_same_v<std::decay_t<T>, types::StringView> ||
                    std::is_same_v<std::decay_t<T>, const char*> || std::is_same_v<std::decay_t<T>, char*>) {
        return Field { k, types::String(v) };
      } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return Field { k, v ? "true" : "false" };
      } else {
        return Field { k, std::format("{}", v) };
      }
    }
  };

  /**
   * @brief Formats fields into a string like: key=value, key2=value2
   */
  inline auto FormatFields(const types::Vec<Field>& fields) -> types::String {
    if (fields.empty())
      return "";

    types::String result;
    result.reserve(fields.size() * 20);

    for (types::usize i = 0; i < fields.size(); ++i) {
      if (i > 0)
        result += ", ";
      result += Stylize(fields[i].key, { .bold = true });
      result += "=";
      result += fields[i].value;
    }

    return result;
  }

  /**
   * @brief Converts "auto distro::core::Distribution::loadOsRelease() const" into "distro::core::Distribution".
   */
  inline auto ExtractTarget(const char* funcName) -> types::String {
    types::StringView func(funcName);

    auto parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    auto lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    auto         spacePos = func.rfind(' ', lastColonPos);
    types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Core Logging Implementation
  // ─────────────────────────────────────────────────────────────────────────────

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    const types::Vec<Field>&    fields,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using namespace std::chrono;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t       nowTt     = system_clock::to_time_t(system_clock::now());
    const types::StringView timestamp = GetCachedTimestamp(nowTt);
    const types::String     message   = std::format(fmt, std::forward<Args>(args)...);
    const types::String     fieldsStr = FormatFields(fields);

    const types::LockGuard lock(GetLogMutex());

    // timestamp LEVEL [file:line] target: message, fields
    Print(level, Stylize(timestamp, { .color = LogColor::Gray, .dim = true }));
    Print(level, " ");
    Print(level, GetLevelInfo().at(static_cast<types::usize>(level)));
    Print(level, " ");
#ifndef NDEBUG
    Print(level, Stylize(std::format("{}:{}", path(loc.file_name()).filename().string(), loc.line()), { .color = LogColor::Gray, .italic = true }));
    Print(level, " ");
#else
    (void)loc;
#endif
    Print(level, Stylize(target, { .bold = true }));
    Print(level, ": ");
    Print(level, message);
    if (!fieldsStr.empty()) {
      Print(level, ", ");
      Print(level, fieldsStr);
    }
    Println(level);
  }

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    LogImpl(level, loc, target, types::Vec<Field> {}, fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Log an error object at the specified level, attributed to where the error was raised.
   */
  template <typename ErrorType>
  auto LogError(
    const LogLevel          level,
    const types::StringView target,
    const ErrorType&        error_obj
  ) {
    using DecayedErrorType = std::decay_t<ErrorType>;

    std::source_location logLocation;
    types::String        errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::DistroError>) {
      logLocation      = error_obj.location;
      errorMessagePart = error_obj.message;
    } else {
      logLocation = std::source_location::current();
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = error_obj.what();
      else if constexpr (requires { error_obj.message; })
        errorMessagePart = error_obj.message;
      else
        errorMessagePart = "Unknown error type logged";
    }

    LogImpl(level, logLocation, target, "{}", errorMessagePart);
  }
} // namespace distro::utils::logging

// ─────────────────────────────────────────────────────────────────────────────
// Macros
// ─────────────────────────────────────────────────────────────────────────────

#define DISTRO_LOG_TARGET ::distro::utils::logging::ExtractTarget(__FUNCTION__)

#define log_field(name, value) ::distro::utils::logging::Field::create(#name, value)

#define trace_log(fmt, ...) \
  ::distro::utils::logging::LogImpl(::distro::utils::logging::LogLevel::Trace, std::source_location::current(), DISTRO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log(fmt, ...) \
  ::distro::utils::logging::LogImpl(::distro::utils::logging::LogLevel::Debug, std::source_location::current(), DISTRO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define info_log(fmt, ...) \
  ::distro::utils::logging::LogImpl(::distro::utils::logging::LogLevel::Info, std::source_location::current(), DISTRO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define warn_log(fmt, ...) \
  ::distro::utils::logging::LogImpl(::distro::utils::logging::LogLevel::Warn, std::source_location::current(), DISTRO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define error_log(fmt, ...) \
  ::distro::utils::logging::LogImpl(::distro::utils::logging::LogLevel::Error, std::source_location::current(), DISTRO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log_fields(fields_vec, fmt, ...) \
  ::distro::utils::logging::LogImpl(::distro::utils::logging::LogLevel::Debug, std::source_location::current(), DISTRO_LOG_TARGET, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)

#define warn_log_fields(fields_vec, fmt, ...) \
  ::distro::utils::logging::LogImpl(::distro::utils::logging::LogLevel::Warn, std::source_location::current(), DISTRO_LOG_TARGET, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(error_obj) \
  ::distro::utils::logging::LogError(::distro::utils::logging::LogLevel::Debug, DISTRO_LOG_TARGET, error_obj)

#define warn_at(error_obj) \
  ::distro::utils::logging::LogError(::distro::utils::logging::LogLevel::Warn, DISTRO_LOG_TARGET, error_obj)

#define error_at(error_obj) \
  ::distro::utils::logging::LogError(::distro::utils::logging::LogLevel::Error, DISTRO_LOG_TARGET, error_obj)
