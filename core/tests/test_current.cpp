#include <boost/ut.hpp>

#include <Distro++/Core/Current.hpp>

#include <Distro++/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace distro::core::current;
  using namespace distro::utils::types;

  "the default distribution is shared"_test = [] -> void {
    expect(&GetDefaultDistribution() == &GetDefaultDistribution());
  };

  "free functions agree with the default distribution"_test = [] -> void {
    const distro::core::Distribution& dist = GetDefaultDistribution();

    expect(GetId() == dist.id());
    expect(GetName(true) == dist.name(true));
    expect(GetVersion(true, true) == dist.version(true, true));
    expect(GetCodename() == dist.codename());
    expect(GetLike() == dist.like());
    expect(GetOsReleaseAttr("id") == dist.osReleaseAttr("id"));
    expect(&GetOsReleaseInfo() == &dist.osReleaseInfo());
    expect(&GetUnameInfo() == &dist.unameInfo());
  };

  "version parts match their projections on this host"_test = [] -> void {
    for (const bool best : { false, true }) {
      const distro::core::VersionParts parts = GetVersionParts(best);

      expect(parts.major == GetMajorVersion(best));
      expect(parts.minor == GetMinorVersion(best));
      expect(parts.buildNumber == GetBuildNumber(best));
    }
  };

  "linux distribution tuple uses the plain accessors"_test = [] -> void {
    const distro::core::LinuxDistributionTuple tuple = GetLinuxDistribution(false);

    expect(tuple.name == GetId());
    expect(tuple.version == GetVersion());
    expect(tuple.codename == GetCodename());
  };

  return 0;
}
