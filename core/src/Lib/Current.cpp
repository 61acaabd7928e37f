#include "Distro++/Core/Current.hpp"

#include "Distro++/Core/Distribution.hpp"

#include "Distro++/Utils/Types.hpp"

using namespace distro::utils::types;

namespace distro::core::current {
  auto GetDefaultDistribution() -> const Distribution& {
    static const Distribution Instance;
    return Instance;
  }

  auto GetId() -> String {
    return GetDefaultDistribution().id();
  }

  auto GetName(const bool pretty) -> String {
    return GetDefaultDistribution().name(pretty);
  }

  auto GetVersion(const bool pretty, const bool best) -> String {
    return GetDefaultDistribution().version(pretty, best);
  }

  auto GetVersionParts(const bool best) -> VersionParts {
    return GetDefaultDistribution().versionParts(best);
  }

  auto GetMajorVersion(const bool best) -> String {
    return GetDefaultDistribution().majorVersion(best);
  }

  auto GetMinorVersion(const bool best) -> String {
    return GetDefaultDistribution().minorVersion(best);
  }

  auto GetBuildNumber(const bool best) -> String {
    return GetDefaultDistribution().buildNumber(best);
  }

  auto GetLike() -> String {
    return GetDefaultDistribution().like();
  }

  auto GetCodename() -> String {
    return GetDefaultDistribution().codename();
  }

  auto GetInfo(const bool pretty, const bool best) -> VersionInfo {
    return GetDefaultDistribution().info(pretty, best);
  }

  auto GetLinuxDistribution(const bool fullName) -> LinuxDistributionTuple {
    return GetDefaultDistribution().linuxDistribution(fullName);
  }

  auto GetOsReleaseInfo() -> const AttributeMap& {
    return GetDefaultDistribution().osReleaseInfo();
  }

  auto GetLsbReleaseInfo() -> const AttributeMap& {
    return GetDefaultDistribution().lsbReleaseInfo();
  }

  auto GetDistroReleaseInfo() -> const AttributeMap& {
    return GetDefaultDistribution().distroReleaseInfo();
  }

  auto GetUnameInfo() -> const AttributeMap& {
    return GetDefaultDistribution().unameInfo();
  }

  auto GetOsReleaseAttr(const StringView attribute) -> String {
    return GetDefaultDistribution().osReleaseAttr(attribute);
  }

  auto GetLsbReleaseAttr(const StringView attribute) -> String {
    return GetDefaultDistribution().lsbReleaseAttr(attribute);
  }

  auto GetDistroReleaseAttr(const StringView attribute) -> String {
    return GetDefaultDistribution().distroReleaseAttr(attribute);
  }

  auto GetUnameAttr(const StringView attribute) -> String {
    return GetDefaultDistribution().unameAttr(attribute);
  }
} // namespace distro::core::current
