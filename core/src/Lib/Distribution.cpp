#include <algorithm>   // std::ranges::{count, find, sort}
#include <filesystem>  // std::filesystem::path
#include <format>      // std::format
#include <regex>       // std::{regex, smatch, regex_search}
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)
#include <utility>     // std::move

#include "Distro++/Core/Distribution.hpp"
#include "Distro++/Core/HostAccess.hpp"
#include "Distro++/Core/Normalization.hpp"
#include "Distro++/Core/Parsers.hpp"

#include "Distro++/Utils/Env.hpp"
#include "Distro++/Utils/Error.hpp"
#include "Distro++/Utils/Logging.hpp"
#include "Distro++/Utils/Types.hpp"

using enum distro::utils::error::DistroErrorCode;
using namespace distro::utils::types;
namespace fs      = std::filesystem;
namespace logging = distro::utils::logging;

namespace {
  using namespace distro::core;

  constexpr StringView DEFAULT_CONF_DIR       = "/etc";
  constexpr StringView USR_LIB_OS_RELEASE     = "/usr/lib/os-release";
  constexpr StringView OS_RELEASE_BASENAME    = "os-release";
  constexpr PCStr      CONF_DIR_ENV_VARIABLE  = "UNIXCONFDIR";
  constexpr PCStr      VERSION_PARTS_PATTERN  = R"((\d+)\.?(\d+)?\.?(\d+)?)";
  constexpr usize      FALLBACK_RELEASE_COUNT = 15;

  // Release files that exist alongside the real one and never identify the distribution.
  constexpr Array<StringView, 5> IGNORED_RELEASE_BASENAMES = {
    "debian_version",
    "lsb-release",
    "oem-release",
    "os-release",
    "system-release",
  };

  // Probed when the configuration directory cannot be listed.
  constexpr Array<StringView, FALLBACK_RELEASE_COUNT> FALLBACK_RELEASE_BASENAMES = {
    "SuSE-release",
    "arch-release",
    "base-release",
    "centos-release",
    "fedora-release",
    "gentoo-release",
    "mageia-release",
    "mandrake-release",
    "mandriva-release",
    "mandrivalinux-release",
    "manjaro-release",
    "oracle-release",
    "redhat-release",
    "sl-release",
    "slackware-version",
  };

  /**
   * @brief Calls each getter in turn and returns the first non-empty result.
   *
   * Later getters are not called once one has produced a value, so sources they would
   * read are left untouched.
   */
  template <typename... Getters>
  auto FirstNonEmpty(Getters&&... getters) -> String {
    String value;
    static_cast<void>(((value = getters(), !value.empty()) || ...));
    return value;
  }

  auto Lookup(const AttributeMap& map, const StringView attribute) -> String {
    if (const auto iter = map.find(attribute); iter != map.end())
      return iter->second;

    return {};
  }

  auto JoinPath(const StringView dir, const StringView basename) -> String {
    return (fs::path(dir) / basename).string();
  }

  auto ResolveConfDir(const String& configured) -> String {
    if (!configured.empty())
      return configured;

    if (Result<String> fromEnv = distro::utils::env::GetNonEmptyEnv(CONF_DIR_ENV_VARIABLE))
      return *fromEnv;

    return String(DEFAULT_CONF_DIR);
  }

  auto ResolveOsReleaseFile(const String& confDir, const FileReader& files) -> String {
    String inConfDir = JoinPath(confDir, OS_RELEASE_BASENAME);

    if (!files.isFile(inConfDir) && files.isFile(USR_LIB_OS_RELEASE))
      return String(USR_LIB_OS_RELEASE);

    return inConfDir;
  }
} // namespace

namespace distro::core {
  Distribution::Distribution(DistributionOptions options)
    : m_files(options.fileReader ? *options.fileReader : GetSystemFileReader()),
      m_commands(options.commandRunner ? *options.commandRunner : GetSystemCommandRunner()),
      m_confDir(ResolveConfDir(options.confDir)),
      m_includeLsb(options.includeLsb),
      m_includeUname(options.includeUname),
      m_osReleaseFile(std::move(options.osReleaseFile)),
      m_distroReleaseFile(std::move(options.distroReleaseFile)) {}

  // ─────────────────────────────────────────────────────────────────────────────
  // Resolved attributes
  // ─────────────────────────────────────────────────────────────────────────────

  auto Distribution::id() const -> String {
    using namespace normalization;

    if (String raw = osReleaseAttr("id"); !raw.empty())
      return NormalizeOsId(raw);

    if (String raw = lsbReleaseAttr("distributor_id"); !raw.empty())
      return NormalizeLsbId(raw);

    if (String raw = distroReleaseAttr("id"); !raw.empty())
      return NormalizeDistroId(raw);

    if (String raw = unameAttr("id"); !raw.empty())
      return NormalizeDistroId(raw);

    return {};
  }

  auto Distribution::name(const bool pretty) const -> String {
    const auto plainName = [this] {
      return FirstNonEmpty(
        [this] { return osReleaseAttr("name"); },
        [this] { return lsbReleaseAttr("distributor_id"); },
        [this] { return distroReleaseAttr("name"); },
        [this] { return unameAttr("name"); }
      );
    };

    if (!pretty)
      return plainName();

    String prettyName = FirstNonEmpty(
      [this] { return osReleaseAttr("pretty_name"); },
      [this] { return lsbReleaseAttr("description"); }
    );

    if (!prettyName.empty())
      return prettyName;

    String       composed      = plainName();
    const String prettyVersion = version(true);

    if (prettyVersion.empty())
      return composed;

    if (composed.empty())
      return prettyVersion;

    return std::format("{} {}", composed, prettyVersion);
  }

  auto Distribution::version(const bool pretty, const bool best) const -> String {
    const Array<String, 6> candidates = {
      osReleaseAttr("version_id"),
      lsbReleaseAttr("release"),
      distroReleaseAttr("version_id"),
      parsers::ExtractVersionId(osReleaseAttr("pretty_name")),
      parsers::ExtractVersionId(lsbReleaseAttr("description")),
      unameAttr("release"),
    };

    String chosen;

    if (best) {
      // Strictly greater, so on equal precision the higher-priority source keeps its place.
      for (const String& candidate : candidates)
        if (chosen.empty() || std::ranges::count(candidate, '.') > std::ranges::count(chosen, '.'))
          chosen = candidate;
    } else {
      for (const String& candidate : candidates)
        if (!candidate.empty()) {
          chosen = candidate;
          break;
        }
    }

    if (pretty && !chosen.empty())
      if (const String codenameValue = codename(); !codenameValue.empty())
        chosen = std::format("{} ({})", chosen, codenameValue);

    return chosen;
  }

  auto Distribution::versionParts(const bool best) const -> VersionParts {
    static const std::regex Pattern(VERSION_PARTS_PATTERN);

    const String versionString = version(false, best);
    std::smatch  match;

    if (versionString.empty() || !std::regex_search(versionString, match, Pattern))
      return {};

    return VersionParts {
      .major       = match[1].str(),
      .minor       = match[2].str(),
      .buildNumber = match[3].str(),
    };
  }

  auto Distribution::majorVersion(const bool best) const -> String {
    return versionParts(best).major;
  }

  auto Distribution::minorVersion(const bool best) const -> String {
    return versionParts(best).minor;
  }

  auto Distribution::buildNumber(const bool best) const -> String {
    return versionParts(best).buildNumber;
  }

  auto Distribution::like() const -> String {
    return osReleaseAttr("id_like");
  }

  auto Distribution::codename() const -> String {
    return FirstNonEmpty(
      [this] { return osReleaseAttr("codename"); },
      [this] { return lsbReleaseAttr("codename"); },
      [this] { return distroReleaseAttr("codename"); }
    );
  }

  auto Distribution::info(const bool pretty, const bool best) const -> VersionInfo {
    return VersionInfo {
      .id           = id(),
      .version      = version(pretty, best),
      .like         = like(),
      .codename     = codename(),
      .versionParts = versionParts(best),
    };
  }

  auto Distribution::linuxDistribution(const bool fullName) const -> LinuxDistributionTuple {
    return LinuxDistributionTuple {
      .name     = fullName ? name() : id(),
      .version  = version(),
      .codename = codename(),
    };
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Raw sources
  // ─────────────────────────────────────────────────────────────────────────────

  auto Distribution::osReleaseInfo() const -> const AttributeMap& {
    return m_osRelease.getOrCompute([this] { return loadOsRelease(); });
  }

  auto Distribution::lsbReleaseInfo() const -> const AttributeMap& {
    return m_lsbRelease.getOrCompute([this] { return loadLsbRelease(); });
  }

  auto Distribution::distroReleaseInfo() const -> const AttributeMap& {
    return m_distroRelease.getOrCompute([this] { return loadDistroRelease(); });
  }

  auto Distribution::unameInfo() const -> const AttributeMap& {
    return m_uname.getOrCompute([this] { return loadUname(); });
  }

  auto Distribution::osReleaseAttr(const StringView attribute) const -> String {
    return Lookup(osReleaseInfo(), attribute);
  }

  auto Distribution::lsbReleaseAttr(const StringView attribute) const -> String {
    return Lookup(lsbReleaseInfo(), attribute);
  }

  auto Distribution::distroReleaseAttr(const StringView attribute) const -> String {
    return Lookup(distroReleaseInfo(), attribute);
  }

  auto Distribution::unameAttr(const StringView attribute) const -> String {
    return Lookup(unameInfo(), attribute);
  }

  auto Distribution::osReleaseFile() const -> String {
    // Same ordering as distroReleaseFile(): the path is settled under m_osRelease's lock.
    static_cast<void>(osReleaseInfo());
    return m_osReleaseFile;
  }

  auto Distribution::distroReleaseFile() const -> String {
    // Discovery records the file it settled on; the lock inside distroReleaseInfo()
    // orders that write before this read.
    static_cast<void>(distroReleaseInfo());
    return m_distroReleaseFile;
  }

  auto Distribution::confDir() const -> const String& {
    return m_confDir;
  }

  auto Distribution::includeLsb() const -> bool {
    return m_includeLsb;
  }

  auto Distribution::includeUname() const -> bool {
    return m_includeUname;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Loaders
  // ─────────────────────────────────────────────────────────────────────────────

  auto Distribution::readOsRelease() const -> Result<AttributeMap> {
    if (m_osReleaseFile.empty())
      m_osReleaseFile = ResolveOsReleaseFile(m_confDir, m_files);

    const String content = TRY(m_files.readFile(m_osReleaseFile));

    return parsers::ParseOsReleaseContent(content);
  }

  auto Distribution::loadOsRelease() const -> AttributeMap {
    Result<AttributeMap> props = readOsRelease();

    if (!props) {
      debug_at(props.error());
      return {};
    }

    const Vec<logging::Field> fields = { log_field(path, m_osReleaseFile), log_field(keys, props->size()) };
    debug_log_fields(fields, "Loaded os-release");

    return std::move(*props);
  }

  auto Distribution::runForLines(const Span<const String> argv) const -> Result<Vec<String>> {
    const CommandOutput output = TRY(m_commands.execute(argv));

    if (output.exitCode != 0)
      ERR_FMT(Other, "`{}` exited with status {}", argv.front(), output.exitCode);

    return parsers::SplitLines(output.stdOut);
  }

  auto Distribution::loadLsbRelease() const -> AttributeMap {
    static const Array<String, 2> Command = { "lsb_release", "-a" };

    if (!m_includeLsb) {
      debug_log("lsb_release source is disabled");
      return {};
    }

    Result<Vec<String>> lines = runForLines(Command);

    if (!lines) {
      debug_at(lines.error());
      return {};
    }

    return parsers::ParseLsbReleaseContent(*lines);
  }

  auto Distribution::loadUname() const -> AttributeMap {
    static const Array<String, 2> Command = { "uname", "-rs" };

    if (!m_includeUname) {
      debug_log("uname source is disabled");
      return {};
    }

    Result<Vec<String>> lines = runForLines(Command);

    if (!lines) {
      debug_at(lines.error());
      return {};
    }

    return parsers::ParseUnameContent(*lines);
  }

  auto Distribution::readDistroReleaseFile(const String& path) const -> Result<AttributeMap> {
    const String content = TRY(m_files.readFile(path));

    // Only the first line counts; SLES, for one, appends more.
    return parsers::ParseDistroReleaseContent(StringView(content).substr(0, content.find('\n')));
  }

  auto Distribution::loadDistroRelease() const -> AttributeMap {
    if (!m_distroReleaseFile.empty()) {
      // An explicitly configured file is parsed as well as possible, whatever its name.
      Result<AttributeMap> parsed = readDistroReleaseFile(m_distroReleaseFile);

      if (!parsed)
        debug_at(parsed.error());

      AttributeMap props = parsed ? std::move(*parsed) : AttributeMap {};

      if (Option<String> word = parsers::MatchReleaseBasename(fs::path(m_distroReleaseFile).filename().string()))
        props["id"] = std::move(*word);

      return props;
    }

    Vec<String> basenames;

    if (Result<Vec<String>> listing = m_files.listDirectory(m_confDir)) {
      basenames = std::move(*listing);
      // Several release files can coexist (CentOS ships redhat-release too); sorting
      // keeps the pick stable.
      std::ranges::sort(basenames);
    } else {
      debug_at(listing.error());
      basenames.assign(FALLBACK_RELEASE_BASENAMES.begin(), FALLBACK_RELEASE_BASENAMES.end());
    }

    for (const String& basename : basenames) {
      if (std::ranges::find(IGNORED_RELEASE_BASENAMES, basename) != IGNORED_RELEASE_BASENAMES.end())
        continue;

      Option<String> word = parsers::MatchReleaseBasename(basename);

      if (!word)
        continue;

      String               path   = JoinPath(m_confDir, basename);
      Result<AttributeMap> parsed = readDistroReleaseFile(path);

      if (!parsed) {
        debug_at(parsed.error());
        continue;
      }

      if (!parsed->contains("name"))
        continue;

      const Vec<logging::Field> fields = { log_field(path, path), log_field(id, *word) };
      debug_log_fields(fields, "Discovered distro release file");

      parsed->insert_or_assign("id", std::move(*word));
      m_distroReleaseFile = std::move(path);

      return std::move(*parsed);
    }

    debug_log("No distro release file found in {}", m_confDir);

    return {};
  }
} // namespace distro::core
