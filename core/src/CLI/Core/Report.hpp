#pragma once

#include <glaze/glaze.hpp>

#include <Distro++/Core/Distribution.hpp>

#include <Distro++/Utils/Types.hpp>

namespace distro::cli {
  namespace types = ::distro::utils::types;

  struct JsonVersionParts {
    types::String major;
    types::String minor;
    types::String buildNumber;
  };

  /**
   * @brief The four raw attribute maps, as read from their sources.
   */
  struct JsonSources {
    types::AttributeMap distroRelease;
    types::AttributeMap lsbRelease;
    types::AttributeMap osRelease;
    types::AttributeMap uname;
  };

  /**
   * @brief JSON shape of the report printed by `distro --json`.
   *
   * @details `sources` is only filled in for `--sources`; glaze skips it otherwise.
   */
  struct JsonReport {
    types::String                     codename;
    types::String                     id;
    types::String                     like;
    types::Option<JsonSources>        sources;
    types::String                     version;
    JsonVersionParts                  versionParts;
  };

  /**
   * @brief Collects the report for @p dist.
   * @param dist Resolver to query
   * @param pretty Whether the version includes the codename
   * @param best Whether to pick the most precise version across all sources
   * @param includeSources Whether to attach the raw attribute maps
   */
  auto BuildJsonReport(const core::Distribution& dist, bool pretty, bool best, bool includeSources) -> JsonReport;
} // namespace distro::cli

namespace glz {
  template <>
  struct meta<distro::cli::JsonVersionParts> {
    using T = distro::cli::JsonVersionParts;

    static constexpr detail::Object value = object("major", &T::major, "minor", &T::minor, "build_number", &T::buildNumber);
  };

  template <>
  struct meta<distro::cli::JsonSources> {
    using T = distro::cli::JsonSources;

    // clang-format off
    static constexpr detail::Object value = object(
      "distro_release", &T::distroRelease,
      "lsb_release",    &T::lsbRelease,
      "os_release",     &T::osRelease,
      "uname",          &T::uname
    );
    // clang-format on
  };

  template <>
  struct meta<distro::cli::JsonReport> {
    using T = distro::cli::JsonReport;

    // clang-format off
    static constexpr detail::Object value = object(
      "codename",      &T::codename,
      "id",            &T::id,
      "like",          &T::like,
      "sources",       &T::sources,
      "version",       &T::version,
      "version_parts", &T::versionParts
    );
    // clang-format on
  };
} // namespace glz
