#pragma once

#include <cerrno>  // errno
#include <cstdlib> // std::getenv, setenv, unsetenv
#include <cstring> // std::strerror

#include "Error.hpp"
#include "Types.hpp"

namespace distro::utils::env {
  namespace types = ::distro::utils::types;
  namespace error = ::distro::utils::error;

  using enum error::DistroErrorCode;

  /**
   * @brief Retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return The value, or NotFound when the variable is unset.
   */
  [[nodiscard]] inline auto GetEnv(types::PCStr name) -> types::Result<types::String> {
    const types::PCStr value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(value);
  }

  /**
   * @brief Retrieves an environment variable, treating an empty value like an unset one.
   */
  [[nodiscard]] inline auto GetNonEmptyEnv(types::PCStr name) -> types::Result<types::String> {
    types::String value = TRY(GetEnv(name));

    if (value.empty())
      ERR_FMT(NotFound, "Environment variable '{}' is empty", name);

    return value;
  }

  /**
   * @brief Sets (overwriting) an environment variable.
   * @param name The name of the environment variable to set.
   * @param value The value to set the environment variable to.
   */
  inline auto SetEnv(types::PCStr name, types::PCStr value) -> types::Result<> {
    if (setenv(name, value, 1) != 0)
      ERR_FMT(InvalidArgument, "Failed to set environment variable '{}': {}", name, std::strerror(errno));

    return {};
  }

  /**
   * @brief Unsets an environment variable. Unsetting a missing variable succeeds.
   * @param name The name of the environment variable to unset.
   */
  inline auto UnsetEnv(types::PCStr name) -> types::Result<> {
    if (unsetenv(name) != 0)
      ERR_FMT(InvalidArgument, "Failed to unset environment variable '{}': {}", name, std::strerror(errno));

    return {};
  }
} // namespace distro::utils::env
