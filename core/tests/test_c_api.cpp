#include <boost/ut.hpp>
#include <filesystem> // std::filesystem::{path, temp_directory_path, create_directories, remove_all}
#include <format>     // std::format
#include <fstream>    // std::ofstream
#include <unistd.h>   // getpid

#include <Distro++/Utils/Types.hpp>

#include "distro_c.h"

namespace fs = std::filesystem;

using namespace distro::utils::types;

namespace {
  // Takes ownership of a string returned by the C API.
  auto Take(CStr* str) -> Option<String> {
    if (!str)
      return None;

    String copy(str);
    DistroFreeString(str);
    return copy;
  }
} // namespace

auto main() -> int {
  using namespace boost::ut;

  const fs::path confDir = fs::temp_directory_path() / std::format("distro-c-api-{}", getpid());
  fs::create_directories(confDir);

  std::ofstream(confDir / "os-release") << "NAME=\"Fedora\"\n"
                                           "VERSION=\"23 (Twenty Three)\"\n"
                                           "ID=fedora\n"
                                           "VERSION_ID=23\n"
                                           "PRETTY_NAME=\"Fedora 23 (Twenty Three)\"\n";
  std::ofstream(confDir / "fedora-release") << "Fedora release 23 (Twenty Three)\n";

  const String        confDirString   = confDir.string();
  const String        osReleaseString = (confDir / "os-release").string();
  const DistroOptions options         = {
    .includeLsb        = false,
    .includeUname      = false,
    .osReleaseFile     = osReleaseString.c_str(),
    .distroReleaseFile = nullptr,
    .confDir           = confDirString.c_str(),
  };

  "string getters"_test = [&options] -> void {
    DistroHandle* handle = DistroCreate(&options);

    expect(handle != nullptr);
    expect(Take(DistroGetId(handle)) == Option<String>("fedora"));
    expect(Take(DistroGetName(handle, false)) == Option<String>("Fedora"));
    expect(Take(DistroGetName(handle, true)) == Option<String>("Fedora 23 (Twenty Three)"));
    expect(Take(DistroGetVersion(handle, true, false)) == Option<String>("23 (Twenty Three)"));
    expect(Take(DistroGetCodename(handle)) == Option<String>("Twenty Three"));
    expect(Take(DistroGetLike(handle)) == Option<String>(""));

    DistroDestroy(handle);
  };

  "attribute getters"_test = [&options] -> void {
    DistroHandle* handle = DistroCreate(&options);

    expect(Take(DistroGetOsReleaseAttr(handle, "version_id")) == Option<String>("23"));
    expect(Take(DistroGetDistroReleaseAttr(handle, "id")) == Option<String>("fedora"));
    expect(Take(DistroGetLsbReleaseAttr(handle, "release")) == Option<String>(""));
    expect(Take(DistroGetUnameAttr(handle, "release")) == Option<String>(""));
    expect(Take(DistroGetOsReleaseAttr(handle, nullptr)) == None);

    DistroDestroy(handle);
  };

  "info fills every field"_test = [&options] -> void {
    DistroHandle*     handle = DistroCreate(&options);
    DistroVersionInfo info {};

    expect(DistroGetInfo(handle, false, true, &info) == DISTRO_SUCCESS);
    expect(String(info.id) == String("fedora"));
    expect(String(info.version) == String("23"));
    expect(String(info.codename) == String("Twenty Three"));
    expect(String(info.major) == String("23"));
    expect(String(info.minor).empty());
    expect(String(info.buildNumber).empty());

    DistroFreeVersionInfo(&info);
    expect(info.id == nullptr);

    DistroDestroy(handle);
  };

  "NULL arguments are rejected"_test = [] -> void {
    DistroVersionInfo info {};

    expect(DistroGetId(nullptr) == nullptr);
    expect(DistroGetVersion(nullptr, false, false) == nullptr);
    expect(DistroGetInfo(nullptr, false, false, &info) == DISTRO_ERROR_INVALID_ARGUMENT);

    DistroFreeString(nullptr);
    DistroFreeVersionInfo(nullptr);
    DistroDestroy(nullptr);
  };

  "NULL options select the defaults"_test = [] -> void {
    DistroHandle* handle = DistroCreate(nullptr);

    expect(handle != nullptr);

    DistroDestroy(handle);
  };

  std::error_code errc;
  fs::remove_all(confDir, errc);

  return 0;
}
