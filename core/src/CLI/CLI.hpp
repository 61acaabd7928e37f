/**
 * @file CLI.hpp
 * @brief Report formatting for the `distro` command-line tool.
 */

#pragma once

#include <Distro++/Core/Distribution.hpp>

#include <Distro++/Utils/Types.hpp>

#include "Core/Report.hpp"

namespace distro::cli {
  /**
   * @brief Formats the human-readable report.
   *
   * @code
   * Name: CentOS Linux 7.1.1503 (Core)
   * Version: 7.1.1503 (Core)
   * Codename: Core
   * @endcode
   */
  auto FormatTextReport(const core::Distribution& dist, bool best) -> types::String;

  /**
   * @brief Formats the raw attribute maps as `<source>:` sections of `key = value` lines.
   *
   * Empty sources are listed with no entries.
   */
  auto FormatSourcesText(const core::Distribution& dist) -> types::String;

  /**
   * @brief Serializes @p report with glaze.
   * @param report Report to write
   * @param prettyJson Whether to pretty-print the JSON
   */
  auto FormatJsonReport(const JsonReport& report, bool prettyJson) -> types::Result<types::String>;
} // namespace distro::cli
