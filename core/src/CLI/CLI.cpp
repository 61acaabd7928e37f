/**
 * @file CLI.cpp
 * @brief Report formatting for the `distro` command-line tool.
 */

#include "CLI.hpp"

#include <format>          // std::format
#include <glaze/glaze.hpp> // glz::{write, write_json, format_error}

#include <Distro++/Utils/Error.hpp>
#include <Distro++/Utils/Types.hpp>

namespace distro::cli {
  using namespace utils::types;
  using enum utils::error::DistroErrorCode;

  namespace {
    auto AppendSection(String& out, const StringView title, const AttributeMap& attributes) -> Unit {
      out += std::format("{}:\n", title);

      for (const auto& [key, value] : attributes)
        out += std::format("  {} = {}\n", key, value);
    }
  } // namespace

  auto FormatTextReport(const core::Distribution& dist, const bool best) -> String {
    String out;

    out += std::format("Name: {}\n", dist.name(true));
    out += std::format("Version: {}\n", dist.version(true, best));
    out += std::format("Codename: {}\n", dist.codename());

    return out;
  }

  auto FormatSourcesText(const core::Distribution& dist) -> String {
    String out;

    AppendSection(out, "os_release", dist.osReleaseInfo());
    AppendSection(out, "lsb_release", dist.lsbReleaseInfo());
    AppendSection(out, "distro_release", dist.distroReleaseInfo());
    AppendSection(out, "uname", dist.unameInfo());

    return out;
  }

  auto BuildJsonReport(const core::Distribution& dist, const bool pretty, const bool best, const bool includeSources) -> JsonReport {
    core::VersionInfo info = dist.info(pretty, best);

    JsonReport report {
      .codename     = std::move(info.codename),
      .id           = std::move(info.id),
      .like         = std::move(info.like),
      .sources      = None,
      .version      = std::move(info.version),
      .versionParts = {
        .major       = std::move(info.versionParts.major),
        .minor       = std::move(info.versionParts.minor),
        .buildNumber = std::move(info.versionParts.buildNumber),
      },
    };

    if (includeSources)
      report.sources = JsonSources {
        .distroRelease = dist.distroReleaseInfo(),
        .lsbRelease    = dist.lsbReleaseInfo(),
        .osRelease     = dist.osReleaseInfo(),
        .uname         = dist.unameInfo(),
      };

    return report;
  }

  auto FormatJsonReport(const JsonReport& report, const bool prettyJson) -> Result<String> {
    String jsonStr;

    glz::error_ctx errorContext =
      prettyJson
      ? glz::write<glz::opts { .prettify = true }>(report, jsonStr)
      : glz::write_json(report, jsonStr);

    if (errorContext)
      ERR_FMT(InternalError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    return jsonStr;
  }
} // namespace distro::cli
