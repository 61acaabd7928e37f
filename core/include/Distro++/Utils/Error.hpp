#pragma once

#include <format>          // std::format
#include <source_location> // std::source_location

#include "Types.hpp"

namespace distro::utils::error {
  /**
   * @enum DistroErrorCode
   * @brief Error categories reported by the data-source layer.
   */
  enum class DistroErrorCode : types::u8 {
    ApiUnavailable,   ///< A required OS service failed unexpectedly at runtime.
    InternalError,    ///< An error occurred within Distro++'s own logic.
    InvalidArgument,  ///< An invalid argument was passed to a function or on the command line.
    IoError,          ///< General I/O error (filesystem, pipes, etc.).
    NotFound,         ///< A file, directory or command was not found.
    ParseError,       ///< Data was read but could not be parsed.
    PermissionDenied, ///< Insufficient permissions to perform the operation.
    Other,            ///< A generic or unclassified error.
  };

  /**
   * @struct DistroError
   * @brief Holds structured information about a failure.
   *
   * Used as the error type in Result for every fallible Distro++ function.
   */
  struct DistroError {
    types::String        message;  ///< A descriptive error message.
    std::source_location location; ///< The source location where the error occurred.
    DistroErrorCode      code;     ///< The general category of the error.

    DistroError(const DistroErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}
  };
} // namespace distro::utils::error

#define ERR(errc, msg)          return ::distro::utils::types::Err(::distro::utils::error::DistroError(errc, msg))
#define ERR_FMT(errc, fmt, ...) return ::distro::utils::types::Err(::distro::utils::error::DistroError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Rust-style error propagation.
 *
 * Evaluates @p expr (a Result<T>). On error, returns that error from the enclosing
 * function; otherwise yields the success value.
 *
 * @note Uses GNU statement expressions on GCC/Clang. MSVC falls back to a throwing
 *       lambda.
 *
 * @code
 * auto ReadOsRelease(const FileReader& reader, StringView path) -> Result<AttributeMap> {
 *   String content = TRY(reader.readFile(path));
 *   return ParseOsReleaseContent(content);
 * }
 * @endcode
 */
#ifdef _MSC_VER
  #define DISTRO_CONCAT_IMPL(a, b) a##b
  #define DISTRO_CONCAT(a, b)      DISTRO_CONCAT_IMPL(a, b)

  #define TRY(expr)            \
    [&]() {                    \
      auto _tmp = (expr);      \
      if (!_tmp)               \
        throw _tmp.error();    \
      return *std::move(_tmp); \
    }()
#else
  #define TRY(expr)                                                                             \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _distro_try_result = (expr);                                                     \
        if (!_distro_try_result)                                                                \
          return ::distro::utils::types::Err(_distro_try_result.error());                       \
        std::move(*_distro_try_result);                                                         \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif

/**
 * @brief Error propagation for Result<void>.
 *
 * @code
 * auto Prepare() -> Result<> {
 *   TRY_VOID(CheckDirectory(confDir));
 *   return {};
 * }
 * @endcode
 */
#ifdef _MSC_VER
  #define TRY_VOID(expr)                                              \
    do {                                                              \
      auto&& _distro_try_result = (expr);                             \
      if (!_distro_try_result)                                        \
        return ::distro::utils::types::Err(_distro_try_result.error()); \
    } while (0)
#else
  #define TRY_VOID(expr)                                                                        \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _distro_try_result = (expr);                                                     \
        if (!_distro_try_result)                                                                \
          return ::distro::utils::types::Err(_distro_try_result.error());                       \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif
