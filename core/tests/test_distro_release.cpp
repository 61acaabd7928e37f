#include <boost/ut.hpp>

#include <Distro++/Core/Parsers.hpp>

#include <Distro++/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace distro::core::parsers;
  using namespace distro::utils::types;

  // ─────────────────────────────────────────────────────────────────────────────
  // Reversed matcher
  // ─────────────────────────────────────────────────────────────────────────────

  "MatchReversed splits name, version and codename"_test = [] -> void {
    const Option<ReversedMatch> match = MatchReversed("CentOS Linux release 7.1.1503 (Core)");

    expect(match.has_value());
    expect(match->name == String("CentOS Linux"));
    expect(match->versionId == String("7.1.1503"));
    expect(match->codename == String("Core"));
  };

  "MatchReversed handles codenames with spaces"_test = [] -> void {
    const Option<ReversedMatch> match = MatchReversed("Fedora release 23 (Twenty Three)");

    expect(match.has_value());
    expect(match->name == String("Fedora"));
    expect(match->versionId == String("23"));
    expect(match->codename == String("Twenty Three"));
  };

  "MatchReversed skips an LTS suffix"_test = [] -> void {
    const Option<ReversedMatch> match = MatchReversed("Linux Mint release 19.1 LTS (Tessa)");

    expect(match.has_value());
    expect(match->name == String("Linux Mint"));
    expect(match->versionId == String("19.1"));
    expect(match->codename == String("Tessa"));
  };

  "MatchReversed without release word or codename"_test = [] -> void {
    const Option<ReversedMatch> match = MatchReversed("Slackware 14.1");

    expect(match.has_value());
    expect(match->name == String("Slackware"));
    expect(match->versionId == String("14.1"));
    expect(match->codename.empty());
  };

  "MatchReversed needs a version"_test = [] -> void {
    expect(!MatchReversed("Ubuntu").has_value());
    expect(!MatchReversed("").has_value());
  };

  "ExtractVersionId pulls the version out of a description"_test = [] -> void {
    expect(ExtractVersionId("Ubuntu 18.04.1 LTS") == String("18.04.1"));
    expect(ExtractVersionId("CentOS Linux 7 (Core)") == String("7"));
    expect(ExtractVersionId("Arch Linux").empty());
    expect(ExtractVersionId("").empty());
  };

  "very long lines are not matched"_test = [] -> void {
    const String line = "Some Distro " + String(100UZ * 1024UZ, 'x') + " release 7.1";

    expect(!MatchReversed(line).has_value());
    expect(ExtractVersionId(line).empty());
  };

  // ─────────────────────────────────────────────────────────────────────────────
  // Release file names
  // ─────────────────────────────────────────────────────────────────────────────

  "MatchReleaseBasename returns the distribution word"_test = [] -> void {
    expect(MatchReleaseBasename("centos-release") == Option<String>("centos"));
    expect(MatchReleaseBasename("SuSE-release") == Option<String>("SuSE"));
    expect(MatchReleaseBasename("slackware-version") == Option<String>("slackware"));
    expect(MatchReleaseBasename("debian_version") == Option<String>("debian"));
  };

  "MatchReleaseBasename rejects other names"_test = [] -> void {
    expect(!MatchReleaseBasename("os-release.bak").has_value());
    expect(!MatchReleaseBasename("-release").has_value());
    expect(!MatchReleaseBasename("hostname").has_value());
    expect(!MatchReleaseBasename("").has_value());
  };

  // ─────────────────────────────────────────────────────────────────────────────
  // Release file content
  // ─────────────────────────────────────────────────────────────────────────────

  "empty line yields an empty map"_test = [] -> void {
    expect(ParseDistroReleaseContent("").empty());
    expect(ParseDistroReleaseContent("   \t").empty());
  };

  "CentOS release line"_test = [] -> void {
    const AttributeMap props = ParseDistroReleaseContent("CentOS Linux release 7.1.1503 (Core)");

    expect(props == AttributeMap {
                      { "name", "CentOS Linux" },
                      { "version_id", "7.1.1503" },
                      { "codename", "Core" },
                    });
  };

  "absent parts are left out"_test = [] -> void {
    const AttributeMap props = ParseDistroReleaseContent("Gentoo Base System release 2.2");

    expect(props == AttributeMap {
                      { "name", "Gentoo Base System" },
                      { "version_id", "2.2" },
                    });
  };

  "very long release line becomes the name"_test = [] -> void {
    const String line = "Some Distro " + String(100UZ * 1024UZ, 'x') + " release 7.1";

    const AttributeMap props = ParseDistroReleaseContent(line);

    expect(props.size() == 1UZ);
    expect(props.at("name") == line);
  };

  "unmatched line becomes the name"_test = [] -> void {
    const AttributeMap props = ParseDistroReleaseContent("  Arch Linux \n");

    expect(props == AttributeMap { { "name", "Arch Linux" } });
  };

  return 0;
}
