#include <algorithm>  // std::ranges::{count, reverse}
#include <atomic>     // std::atomic
#include <boost/ut.hpp>
#include <filesystem> // std::filesystem::path
#include <thread>     // std::jthread

#include <Distro++/Core/Distribution.hpp>
#include <Distro++/Core/HostAccess.hpp>

#include <Distro++/Utils/Env.hpp>
#include <Distro++/Utils/Error.hpp>
#include <Distro++/Utils/Types.hpp>

using namespace distro::core;
using namespace distro::utils::types;
using enum distro::utils::error::DistroErrorCode;

namespace {
  /**
   * @brief In-memory file system keyed by absolute path.
   */
  class FakeFileReader final : public FileReader {
   public:
    Map<String, String> files;
    bool                listingFails = false;

    mutable std::atomic<i32> reads { 0 };
    mutable std::atomic<i32> fileChecks { 0 };

    [[nodiscard]] auto readFile(const StringView path) const -> Result<String> override {
      ++reads;

      if (const auto iter = files.find(path); iter != files.end())
        return iter->second;

      ERR_FMT(NotFound, "File '{}' does not exist", path);
    }

    [[nodiscard]] auto listDirectory(const StringView path) const -> Result<Vec<String>> override {
      if (listingFails)
        ERR_FMT(PermissionDenied, "Cannot list '{}'", path);

      Vec<String> names;

      for (const auto& [file, content] : files)
        if (std::filesystem::path(file).parent_path() == std::filesystem::path(path))
          names.emplace_back(std::filesystem::path(file).filename().string());

      // Real listings come back in no particular order.
      std::ranges::reverse(names);

      return names;
    }

    [[nodiscard]] auto isFile(const StringView path) const -> bool override {
      ++fileChecks;
      return files.contains(path);
    }
  };

  /**
   * @brief Answers commands by program name and records every invocation.
   */
  class FakeCommandRunner final : public CommandRunner {
   public:
    Map<String, CommandOutput> outputs;

    mutable Vec<String> invoked;

    [[nodiscard]] auto execute(const Span<const String> argv) const -> Result<CommandOutput> override {
      invoked.emplace_back(argv.front());

      if (const auto iter = outputs.find(argv.front()); iter != outputs.end())
        return iter->second;

      ERR_FMT(NotFound, "Command '{}' not found", argv.front());
    }
  };

  auto OptionsFor(const FakeFileReader& files, const FakeCommandRunner& commands) -> DistributionOptions {
    return DistributionOptions {
      .confDir       = "/etc",
      .fileReader    = &files,
      .commandRunner = &commands,
    };
  }

  constexpr PCStr UBUNTU_OS_RELEASE = R"(NAME="Ubuntu"
VERSION="18.04.1 LTS (Bionic Beaver)"
ID=ubuntu
ID_LIKE=debian
PRETTY_NAME="Ubuntu 18.04.1 LTS"
VERSION_ID="18.04"
VERSION_CODENAME=bionic
)";

  constexpr PCStr UBUNTU_LSB_RELEASE = "Distributor ID:\tUbuntu\n"
                                       "Description:\tUbuntu 18.04.1 LTS\n"
                                       "Release:\t18.04\n"
                                       "Codename:\tbionic\n";

  constexpr PCStr CENTOS_RELEASE = "CentOS Linux release 7.1.1503 (Core)\n";
} // namespace

auto main() -> int {
  using namespace boost::ut;

  // ─────────────────────────────────────────────────────────────────────────────
  // Scenarios
  // ─────────────────────────────────────────────────────────────────────────────

  "Ubuntu with os-release and lsb_release"_test = [] -> void {
    FakeFileReader files;
    files.files = {
      { "/etc/os-release", UBUNTU_OS_RELEASE },
      { "/etc/lsb-release", "DISTRIB_ID=Ubuntu\n" },
      { "/etc/debian_version", "buster/sid\n" },
    };

    FakeCommandRunner commands;
    commands.outputs = {
      { "lsb_release", { .exitCode = 0, .stdOut = UBUNTU_LSB_RELEASE } },
      { "uname", { .exitCode = 0, .stdOut = "Linux 4.15.0-29-generic\n" } },
    };

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.id() == String("ubuntu"));
    expect(dist.name() == String("Ubuntu"));
    expect(dist.name(true) == String("Ubuntu 18.04.1 LTS"));
    expect(dist.version() == String("18.04"));
    expect(dist.version(true) == String("18.04 (Bionic Beaver)"));
    expect(dist.version(false, true) == String("18.04.1"));
    expect(dist.codename() == String("Bionic Beaver"));
    expect(dist.like() == String("debian"));

    expect(dist.lsbReleaseAttr("release") == String("18.04"));
    expect(dist.lsbReleaseAttr("codename") == String("bionic"));
    expect(dist.unameInfo().empty());

    // debian_version, lsb-release and os-release are never taken as the release file.
    expect(dist.distroReleaseInfo().empty());
    expect(dist.distroReleaseFile().empty());
  };

  "CentOS discovered from its release file"_test = [] -> void {
    FakeFileReader files;
    files.files = {
      { "/etc/centos-release", CENTOS_RELEASE },
      { "/etc/redhat-release", CENTOS_RELEASE },
      { "/etc/system-release", CENTOS_RELEASE },
    };

    FakeCommandRunner commands;
    commands.outputs = {
      { "uname", { .exitCode = 0, .stdOut = "Linux 3.10.0-229.el7.x86_64\n" } },
    };

    const Distribution dist(DistributionOptions {
      .includeLsb    = false,
      .confDir       = "/etc",
      .fileReader    = &files,
      .commandRunner = &commands,
    });

    expect(dist.distroReleaseInfo() == AttributeMap {
                                         { "name", "CentOS Linux" },
                                         { "version_id", "7.1.1503" },
                                         { "codename", "Core" },
                                         { "id", "centos" },
                                       });
    expect(dist.distroReleaseFile() == String("/etc/centos-release"));

    expect(dist.id() == String("centos"));
    expect(dist.name() == String("CentOS Linux"));
    expect(dist.name(true) == String("CentOS Linux 7.1.1503 (Core)"));
    expect(dist.version() == String("7.1.1503"));
    expect(dist.codename() == String("Core"));

    const LinuxDistributionTuple full = dist.linuxDistribution();
    expect(full.name == String("CentOS Linux"));
    expect(full.version == String("7.1.1503"));
    expect(full.codename == String("Core"));
    expect(dist.linuxDistribution(false).name == String("centos"));

    const VersionInfo info = dist.info(true);
    expect(info.id == String("centos"));
    expect(info.version == String("7.1.1503 (Core)"));
    expect(info.like.empty());
    expect(info.versionParts == VersionParts { .major = "7", .minor = "1", .buildNumber = "1503" });
  };

  "Red Hat release file id is normalized"_test = [] -> void {
    FakeFileReader files;
    files.files = {
      { "/etc/redhat-release", "Red Hat Enterprise Linux Server release 7.5 (Maipo)\n" },
    };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.distroReleaseAttr("id") == String("redhat"));
    expect(dist.id() == String("rhel"));
    expect(dist.codename() == String("Maipo"));
  };

  "lsb_release id is normalized when there is no os-release"_test = [] -> void {
    FakeFileReader    files;
    FakeCommandRunner commands;
    commands.outputs = {
      { "lsb_release", { .exitCode = 0, .stdOut = "Distributor ID:\tRedHatEnterpriseServer\nRelease:\t6.10\n" } },
    };

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.id() == String("rhel"));
    expect(dist.version() == String("6.10"));
  };

  "os-release id is lower-cased but not remapped"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/etc/os-release", "ID=\"OL\"\nVERSION_ID=\"7.6\"\n" } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.id() == String("ol"));
  };

  "Linux uname output is ignored"_test = [] -> void {
    FakeFileReader    files;
    FakeCommandRunner commands;
    commands.outputs = {
      { "uname", { .exitCode = 0, .stdOut = "Linux 5.4.0-generic\n" } },
    };

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.unameInfo().empty());
    expect(dist.id().empty());
  };

  "BSD identified from uname"_test = [] -> void {
    FakeFileReader    files;
    FakeCommandRunner commands;
    commands.outputs = {
      { "uname", { .exitCode = 0, .stdOut = "FreeBSD 12.1-RELEASE\n" } },
    };

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.id() == String("freebsd"));
    expect(dist.name() == String("FreeBSD"));
    expect(dist.version() == String("12.1"));
  };

  "no data source yields empty values"_test = [] -> void {
    FakeFileReader    files;
    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.id().empty());
    expect(dist.name().empty());
    expect(dist.name(true).empty());
    expect(dist.version().empty());
    expect(dist.version(true, true).empty());
    expect(dist.codename().empty());
    expect(dist.like().empty());
    expect(dist.versionParts() == VersionParts {});

    const VersionInfo info = dist.info(true, true);
    expect(info.id.empty());
    expect(info.version.empty());
    expect(info.like.empty());
    expect(info.codename.empty());
    expect(info.versionParts == VersionParts {});

    expect(dist.osReleaseInfo().empty());
    expect(dist.lsbReleaseInfo().empty());
    expect(dist.distroReleaseInfo().empty());
    expect(dist.unameInfo().empty());
    expect(dist.osReleaseAttr("id").empty());
  };

  // ─────────────────────────────────────────────────────────────────────────────
  // Version selection
  // ─────────────────────────────────────────────────────────────────────────────

  "best version prefers the most precise candidate"_test = [] -> void {
    FakeFileReader files;
    files.files = {
      { "/etc/os-release", "ID=centos\nVERSION_ID=\"7\"\n" },
      { "/etc/centos-release", CENTOS_RELEASE },
    };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.version() == String("7"));
    expect(dist.version(false, true) == String("7.1.1503"));
    expect(dist.versionParts() == VersionParts { .major = "7", .minor = "", .buildNumber = "" });
    expect(dist.versionParts(true) == VersionParts { .major = "7", .minor = "1", .buildNumber = "1503" });
  };

  "best version keeps the earliest of equally precise candidates"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/etc/os-release", "ID=foo\nVERSION_ID=1.2\n" } };

    FakeCommandRunner commands;
    commands.outputs = {
      { "lsb_release", { .exitCode = 0, .stdOut = "Release:\t3.4\n" } },
    };

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.version(false, true) == String("1.2"));
  };

  "version parts match their projections"_test = [] -> void {
    FakeFileReader files;
    files.files = {
      { "/etc/os-release", UBUNTU_OS_RELEASE },
      { "/etc/centos-release", CENTOS_RELEASE },
    };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    for (const bool best : { false, true }) {
      const VersionParts parts = dist.versionParts(best);

      expect(parts.major == dist.majorVersion(best));
      expect(parts.minor == dist.minorVersion(best));
      expect(parts.buildNumber == dist.buildNumber(best));
    }

    expect(dist.majorVersion() == String("18"));
    expect(dist.minorVersion() == String("04"));
    expect(dist.buildNumber().empty());
  };

  "pretty name falls back to name and version"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/etc/os-release", "NAME=\"Foo\"\nVERSION_ID=2\n" } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.name(true) == String("Foo 2"));
  };

  "pretty name without any name is the pretty version alone"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/etc/os-release", "VERSION=\"7.1 (Core)\"\nVERSION_ID=\"7.1\"\n" } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.name().empty());
    expect(dist.name(true) == String("7.1 (Core)"));
  };

  "pretty name without a version is the name alone"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/etc/os-release", "NAME=\"Foo\"\n" } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.name(true) == String("Foo"));
  };

  // ─────────────────────────────────────────────────────────────────────────────
  // Options
  // ─────────────────────────────────────────────────────────────────────────────

  "disabled commands are never run"_test = [] -> void {
    FakeFileReader    files;
    FakeCommandRunner commands;
    commands.outputs = {
      { "lsb_release", { .exitCode = 0, .stdOut = UBUNTU_LSB_RELEASE } },
      { "uname", { .exitCode = 0, .stdOut = "FreeBSD 12.1-RELEASE\n" } },
    };

    const Distribution dist(DistributionOptions {
      .includeLsb    = false,
      .includeUname  = false,
      .confDir       = "/etc",
      .fileReader    = &files,
      .commandRunner = &commands,
    });

    expect(dist.lsbReleaseInfo().empty());
    expect(dist.unameInfo().empty());
    expect(dist.id().empty());
    expect(commands.invoked.empty());
    expect(!dist.includeLsb());
    expect(!dist.includeUname());
  };

  "failing lsb_release yields an empty map"_test = [] -> void {
    FakeFileReader    files;
    FakeCommandRunner commands;
    commands.outputs = {
      { "lsb_release", { .exitCode = 1, .stdOut = "Distributor ID:\tUbuntu\n" } },
    };

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.lsbReleaseInfo().empty());
  };

  "explicit release file is used whatever it is called"_test = [] -> void {
    FakeFileReader files;
    files.files = {
      { "/srv/root/etc/acme-release", "Acme OS release 3.2 (Roadrunner)\nextra line\n" },
      { "/etc/centos-release", CENTOS_RELEASE },
    };

    FakeCommandRunner commands;

    const Distribution dist(DistributionOptions {
      .distroReleaseFile = "/srv/root/etc/acme-release",
      .confDir           = "/etc",
      .fileReader        = &files,
      .commandRunner     = &commands,
    });

    expect(dist.distroReleaseInfo() == AttributeMap {
                                         { "name", "Acme OS" },
                                         { "version_id", "3.2" },
                                         { "codename", "Roadrunner" },
                                         { "id", "acme" },
                                       });
    expect(dist.distroReleaseFile() == String("/srv/root/etc/acme-release"));
  };

  "explicit release file with an unusual name gets no id"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/tmp/release.txt", "Acme OS 3.2\n" } };

    FakeCommandRunner commands;

    const Distribution dist(DistributionOptions {
      .distroReleaseFile = "/tmp/release.txt",
      .confDir           = "/etc",
      .fileReader        = &files,
      .commandRunner     = &commands,
    });

    expect(dist.distroReleaseAttr("name") == String("Acme OS"));
    expect(!dist.distroReleaseInfo().contains("id"));
  };

  "unlistable directory falls back to known release files"_test = [] -> void {
    FakeFileReader files;
    files.listingFails = true;
    files.files        = { { "/etc/gentoo-release", "Gentoo Base System release 2.2\n" } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.id() == String("gentoo"));
    expect(dist.version() == String("2.2"));
    expect(dist.distroReleaseFile() == String("/etc/gentoo-release"));
  };

  "release files without content are skipped"_test = [] -> void {
    FakeFileReader files;
    files.files = {
      { "/etc/arch-release", "" },
      { "/etc/manjaro-release", "Manjaro Linux\n" },
    };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.distroReleaseAttr("id") == String("manjaro"));
    expect(dist.distroReleaseAttr("name") == String("Manjaro Linux"));
  };

  "os-release falls back to /usr/lib"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/usr/lib/os-release", "ID=arch\nNAME=\"Arch Linux\"\n" } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.osReleaseFile() == String("/usr/lib/os-release"));
    expect(dist.id() == String("arch"));
  };

  "os-release location is settled on first use"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/usr/lib/os-release", "ID=arch\n" } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(files.fileChecks.load() == 0);
    expect(files.reads.load() == 0);

    expect(dist.id() == String("arch"));
    expect(files.fileChecks.load() > 0);
  };

  "malformed os-release yields an empty map"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/etc/os-release", "ID=arch\nNAME=\"Arch Linux\n" } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    expect(dist.osReleaseInfo().empty());
  };

  "configuration directory comes from UNIXCONFDIR"_test = [] -> void {
    using namespace distro::utils::env;

    FakeFileReader files;
    files.files = { { "/srv/etc/os-release", "ID=debian\n" } };

    FakeCommandRunner commands;

    expect(SetEnv("UNIXCONFDIR", "/srv/etc").has_value());

    const Distribution dist(DistributionOptions {
      .includeLsb    = false,
      .includeUname  = false,
      .fileReader    = &files,
      .commandRunner = &commands,
    });

    expect(UnsetEnv("UNIXCONFDIR").has_value());

    expect(dist.confDir() == String("/srv/etc"));
    expect(dist.osReleaseFile() == String("/srv/etc/os-release"));
    expect(dist.id() == String("debian"));
  };

  // ─────────────────────────────────────────────────────────────────────────────
  // Caching
  // ─────────────────────────────────────────────────────────────────────────────

  "sources are read once"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/etc/os-release", UBUNTU_OS_RELEASE } };

    FakeCommandRunner commands;

    const Distribution dist(OptionsFor(files, commands));

    static_cast<void>(dist.id());
    static_cast<void>(dist.name(true));
    static_cast<void>(dist.info(true, true));

    expect(files.reads.load() >= 1);

    const i32 readsAfterFirstUse = files.reads.load();

    static_cast<void>(dist.info(true, true));
    static_cast<void>(dist.osReleaseInfo());
    static_cast<void>(dist.distroReleaseFile());

    expect(files.reads.load() == readsAfterFirstUse);
    expect(std::ranges::count(commands.invoked, String("lsb_release")) == 1);
    expect(std::ranges::count(commands.invoked, String("uname")) == 1);
  };

  "concurrent readers share one load"_test = [] -> void {
    FakeFileReader files;
    files.files = { { "/etc/os-release", UBUNTU_OS_RELEASE } };

    FakeCommandRunner commands;

    const Distribution dist(DistributionOptions {
      .includeLsb    = false,
      .includeUname  = false,
      .confDir       = "/etc",
      .fileReader    = &files,
      .commandRunner = &commands,
    });

    {
      Vec<std::jthread> threads;

      for (i32 i = 0; i < 8; ++i)
        threads.emplace_back([&dist] { static_cast<void>(dist.osReleaseInfo()); });
    }

    expect(files.reads.load() == 1);
    expect(dist.id() == String("ubuntu"));
  };

  return 0;
}
