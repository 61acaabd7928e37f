/**
 * @file Current.hpp
 * @brief Queries about the distribution the current process runs on.
 *
 * These free functions forward to a single process-wide Distribution built with
 * default options on first use. It is never rebuilt, so every call sees the same
 * data sources.
 *
 * @code{.cpp}
 * #include <print>
 * #include <Distro++/Core/Current.hpp>
 *
 * auto main() -> int {
 *   using namespace distro::core::current;
 *
 *   std::println("{} {}", GetId(), GetVersion(false, true)); // centos 7.1.1503
 * }
 * @endcode
 */

#pragma once

#include "../Utils/Types.hpp"

#include "Distribution.hpp"

namespace distro::core::current {
  namespace types = ::distro::utils::types;

  /**
   * @brief The process-wide Distribution. Constructed on first call; thread-safe.
   */
  auto GetDefaultDistribution() -> const Distribution&;

  auto GetId() -> types::String;
  auto GetName(bool pretty = false) -> types::String;
  auto GetVersion(bool pretty = false, bool best = false) -> types::String;
  auto GetVersionParts(bool best = false) -> VersionParts;
  auto GetMajorVersion(bool best = false) -> types::String;
  auto GetMinorVersion(bool best = false) -> types::String;
  auto GetBuildNumber(bool best = false) -> types::String;
  auto GetLike() -> types::String;
  auto GetCodename() -> types::String;
  auto GetInfo(bool pretty = false, bool best = false) -> VersionInfo;
  auto GetLinuxDistribution(bool fullName = true) -> LinuxDistributionTuple;

  auto GetOsReleaseInfo() -> const types::AttributeMap&;
  auto GetLsbReleaseInfo() -> const types::AttributeMap&;
  auto GetDistroReleaseInfo() -> const types::AttributeMap&;
  auto GetUnameInfo() -> const types::AttributeMap&;

  auto GetOsReleaseAttr(types::StringView attribute) -> types::String;
  auto GetLsbReleaseAttr(types::StringView attribute) -> types::String;
  auto GetDistroReleaseAttr(types::StringView attribute) -> types::String;
  auto GetUnameAttr(types::StringView attribute) -> types::String;
} // namespace distro::core::current
