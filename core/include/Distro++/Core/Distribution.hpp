/**
 * @file Distribution.hpp
 * @brief The resolver: combines the four data sources into one answer per attribute.
 *
 * Data sources, highest priority first:
 *  1. the os-release file (`/etc/os-release`, falling back to `/usr/lib/os-release`)
 *  2. the output of `lsb_release -a`
 *  3. a legacy release file such as `/etc/centos-release`
 *  4. the output of `uname -rs`
 *
 * Each source is read at most once per Distribution, on first use, and the result is
 * kept for the lifetime of the object. Queries never fail: a source that is missing,
 * unreadable or malformed simply contributes nothing, and an attribute no source
 * provides is returned as an empty string.
 */

#pragma once

#include "../Utils/Lazy.hpp"
#include "../Utils/Types.hpp"

#include "HostAccess.hpp"

namespace distro::core {
  namespace types = ::distro::utils::types;

  /**
   * @struct DistributionOptions
   * @brief Construction-time configuration of a Distribution.
   */
  struct DistributionOptions {
    bool includeLsb   = true; ///< Whether to run `lsb_release -a`.
    bool includeUname = true; ///< Whether to run `uname -rs`.

    /// Path of the os-release file. Empty means `<confDir>/os-release`, or
    /// `/usr/lib/os-release` when only that one exists.
    types::String osReleaseFile;

    /// Path of the legacy release file. Empty means discover it in confDir.
    types::String distroReleaseFile;

    /// Directory holding os-release and the legacy release files. Empty means the
    /// `UNIXCONFDIR` environment variable, or `/etc` when that is unset.
    types::String confDir;

    const FileReader*    fileReader    = nullptr; ///< Not owned. Null means GetSystemFileReader().
    const CommandRunner* commandRunner = nullptr; ///< Not owned. Null means GetSystemCommandRunner().
  };

  /**
   * @struct VersionParts
   * @brief The numeric components of a version string. Missing components are `""`.
   */
  struct VersionParts {
    types::String major;
    types::String minor;
    types::String buildNumber;

    auto operator==(const VersionParts&) const -> bool = default;
  };

  /**
   * @struct VersionInfo
   * @brief Everything info() reports, in one value.
   */
  struct VersionInfo {
    types::String id;
    types::String version;
    types::String like;
    types::String codename;
    VersionParts  versionParts;
  };

  /**
   * @struct LinuxDistributionTuple
   * @brief The (name, version, codename) triple used by older tooling.
   */
  struct LinuxDistributionTuple {
    types::String name;
    types::String version;
    types::String codename;
  };

  /**
   * @class Distribution
   * @brief Resolves the identity of the running distribution.
   *
   * Thread-safe: any number of threads may query the same instance. Concurrent first
   * queries of a source wait for a single read of that source.
   *
   * @code{.cpp}
   * distro::core::Distribution dist;
   *
   * std::println("{} {} ({})", dist.name(), dist.version(), dist.codename());
   * // Ubuntu 18.04 (Bionic Beaver)
   * @endcode
   */
  class Distribution {
   public:
    explicit Distribution(DistributionOptions options = {});

    Distribution(const Distribution&)                    = delete;
    Distribution(Distribution&&)                         = delete;
    auto operator=(const Distribution&) -> Distribution& = delete;
    auto operator=(Distribution&&) -> Distribution&      = delete;
    ~Distribution()                                      = default;

    /**
     * @brief Machine-readable distribution ID, e.g. `ubuntu`, `rhel`, `freebsd`.
     *
     * Always lower case with underscores instead of spaces, and passed through the
     * normalization table of the source it came from.
     */
    [[nodiscard]] auto id() const -> types::String;

    /**
     * @brief Distribution name, e.g. `Ubuntu`.
     * @param pretty Prefer the descriptive name (`Ubuntu 18.04.1 LTS`). When no source
     *        carries one, the plain name is followed by the pretty version.
     */
    [[nodiscard]] auto name(bool pretty = false) const -> types::String;

    /**
     * @brief Distribution version, e.g. `18.04`.
     * @param pretty Append the codename in parentheses: `7.1.1503 (Core)`.
     * @param best Pick the most precise candidate (the one with the most dots) across
     *        all sources instead of the first one found. Ties go to the higher-priority
     *        source.
     */
    [[nodiscard]] auto version(bool pretty = false, bool best = false) const -> types::String;

    /**
     * @brief Major, minor and build number of version(false, best).
     */
    [[nodiscard]] auto versionParts(bool best = false) const -> VersionParts;

    [[nodiscard]] auto majorVersion(bool best = false) const -> types::String;
    [[nodiscard]] auto minorVersion(bool best = false) const -> types::String;
    [[nodiscard]] auto buildNumber(bool best = false) const -> types::String;

    /**
     * @brief Space-separated IDs of related distributions (os-release `ID_LIKE`).
     */
    [[nodiscard]] auto like() const -> types::String;

    /**
     * @brief Release codename, e.g. `Bionic Beaver` or `Core`.
     */
    [[nodiscard]] auto codename() const -> types::String;

    [[nodiscard]] auto info(bool pretty = false, bool best = false) const -> VersionInfo;

    /**
     * @brief `(name or id, version, codename)`; name() when @p fullName, id() otherwise.
     */
    [[nodiscard]] auto linuxDistribution(bool fullName = true) const -> LinuxDistributionTuple;

    // Raw per-source attributes. Computed on first call, then cached.
    [[nodiscard]] auto osReleaseInfo() const -> const types::AttributeMap&;
    [[nodiscard]] auto lsbReleaseInfo() const -> const types::AttributeMap&;
    [[nodiscard]] auto distroReleaseInfo() const -> const types::AttributeMap&;
    [[nodiscard]] auto unameInfo() const -> const types::AttributeMap&;

    // Single raw attribute, `""` when absent.
    [[nodiscard]] auto osReleaseAttr(types::StringView attribute) const -> types::String;
    [[nodiscard]] auto lsbReleaseAttr(types::StringView attribute) const -> types::String;
    [[nodiscard]] auto distroReleaseAttr(types::StringView attribute) const -> types::String;
    [[nodiscard]] auto unameAttr(types::StringView attribute) const -> types::String;

    /**
     * @brief The os-release file in use. Reads os-release when it has not been read yet;
     *        without a configured file this is `<confDir>/os-release`, or
     *        `/usr/lib/os-release` when only that one exists.
     */
    [[nodiscard]] auto osReleaseFile() const -> types::String;

    /**
     * @brief The legacy release file in use. Triggers discovery when none was configured,
     *        and is `""` when discovery found nothing.
     */
    [[nodiscard]] auto distroReleaseFile() const -> types::String;

    [[nodiscard]] auto confDir() const -> const types::String&;
    [[nodiscard]] auto includeLsb() const -> bool;
    [[nodiscard]] auto includeUname() const -> bool;

   private:
    auto loadOsRelease() const -> types::AttributeMap;
    auto loadLsbRelease() const -> types::AttributeMap;
    auto loadDistroRelease() const -> types::AttributeMap;
    auto loadUname() const -> types::AttributeMap;

    auto readOsRelease() const -> types::Result<types::AttributeMap>;
    auto readDistroReleaseFile(const types::String& path) const -> types::Result<types::AttributeMap>;
    auto runForLines(types::Span<const types::String> argv) const -> types::Result<types::Vec<types::String>>;

    const FileReader&    m_files;
    const CommandRunner& m_commands;

    types::String m_confDir;
    bool          m_includeLsb;
    bool          m_includeUname;

    // Written only by readOsRelease(), under m_osRelease's lock.
    mutable types::String m_osReleaseFile;

    // Written only by loadDistroRelease(), under m_distroRelease's lock.
    mutable types::String m_distroReleaseFile;

    utils::Lazy<types::AttributeMap> m_osRelease;
    utils::Lazy<types::AttributeMap> m_lsbRelease;
    utils::Lazy<types::AttributeMap> m_distroRelease;
    utils::Lazy<types::AttributeMap> m_uname;
  };
} // namespace distro::core
