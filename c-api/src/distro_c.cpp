#include "../include/distro_c.h"

#include <cstring> // std::memcpy

#include <Distro++/Core/Distribution.hpp>

#include <Distro++/Utils/Error.hpp>
#include <Distro++/Utils/Logging.hpp>
#include <Distro++/Utils/Types.hpp>

using namespace distro::core;
using namespace distro::utils::types;

// Convert C++ DistroErrorCode to C DistroErrorCode enum value
#define TO_C_ERROR(errc) static_cast<::DistroErrorCode>(static_cast<u8>(errc))

namespace {
  auto DupString(const String& str) -> CStr* {
    CStr* result = new CStr[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
  }

  auto OptionalPath(PCStr path) -> String {
    return path ? String(path) : String();
  }

  // Runs a string query and copies its result for the caller. Nothing escapes
  // across the C boundary; a failure is logged and reported as NULL.
  template <typename QueryFn>
  auto GuardedString(QueryFn&& query) noexcept -> CStr* {
    try {
      return DupString(query());
    } catch (const Exception& e) {
      error_at(e);
      return nullptr;
    }
  }
} // namespace

struct DistroHandle {
  explicit DistroHandle(DistributionOptions options)
    : inner(std::move(options)) {}

  Distribution inner;
};

extern "C" {
  auto DistroCreate(const DistroOptions* options) noexcept -> DistroHandle* {
    try {
      if (!options)
        return new DistroHandle(DistributionOptions {});

      return new DistroHandle(DistributionOptions {
        .includeLsb        = options->includeLsb,
        .includeUname      = options->includeUname,
        .osReleaseFile     = OptionalPath(options->osReleaseFile),
        .distroReleaseFile = OptionalPath(options->distroReleaseFile),
        .confDir           = OptionalPath(options->confDir),
      });
    } catch (const Exception& e) {
      error_at(e);
      return nullptr;
    }
  }

  auto DistroDestroy(DistroHandle* handle) noexcept -> void {
    delete handle;
  }

  auto DistroFreeString(CStr* str) noexcept -> void {
    delete[] str;
  }

  auto DistroFreeVersionInfo(DistroVersionInfo* info) noexcept -> void {
    if (!info)
      return;

    delete[] info->id;
    delete[] info->version;
    delete[] info->like;
    delete[] info->codename;
    delete[] info->major;
    delete[] info->minor;
    delete[] info->buildNumber;
    *info = { nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr };
  }

  auto DistroGetId(const DistroHandle* handle) noexcept -> CStr* {
    if (!handle)
      return nullptr;

    return GuardedString([handle] { return handle->inner.id(); });
  }

  auto DistroGetName(const DistroHandle* handle, const bool pretty) noexcept -> CStr* {
    if (!handle)
      return nullptr;

    return GuardedString([handle, pretty] { return handle->inner.name(pretty); });
  }

  auto DistroGetVersion(const DistroHandle* handle, const bool pretty, const bool best) noexcept -> CStr* {
    if (!handle)
      return nullptr;

    return GuardedString([handle, pretty, best] { return handle->inner.version(pretty, best); });
  }

  auto DistroGetCodename(const DistroHandle* handle) noexcept -> CStr* {
    if (!handle)
      return nullptr;

    return GuardedString([handle] { return handle->inner.codename(); });
  }

  auto DistroGetLike(const DistroHandle* handle) noexcept -> CStr* {
    if (!handle)
      return nullptr;

    return GuardedString([handle] { return handle->inner.like(); });
  }

  auto DistroGetOsReleaseAttr(const DistroHandle* handle, PCStr attribute) noexcept -> CStr* {
    if (!handle || !attribute)
      return nullptr;

    return GuardedString([handle, attribute] { return handle->inner.osReleaseAttr(attribute); });
  }

  auto DistroGetLsbReleaseAttr(const DistroHandle* handle, PCStr attribute) noexcept -> CStr* {
    if (!handle || !attribute)
      return nullptr;

    return GuardedString([handle, attribute] { return handle->inner.lsbReleaseAttr(attribute); });
  }

  auto DistroGetDistroReleaseAttr(const DistroHandle* handle, PCStr attribute) noexcept -> CStr* {
    if (!handle || !attribute)
      return nullptr;

    return GuardedString([handle, attribute] { return handle->inner.distroReleaseAttr(attribute); });
  }

  auto DistroGetUnameAttr(const DistroHandle* handle, PCStr attribute) noexcept -> CStr* {
    if (!handle || !attribute)
      return nullptr;

    return GuardedString([handle, attribute] { return handle->inner.unameAttr(attribute); });
  }

  auto DistroGetInfo(const DistroHandle* handle, const bool pretty, const bool best, DistroVersionInfo* out_info) noexcept -> ::DistroErrorCode {
    using enum distro::utils::error::DistroErrorCode;

    if (!handle || !out_info)
      return TO_C_ERROR(InvalidArgument);

    *out_info = { nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr };

    try {
      const VersionInfo info = handle->inner.info(pretty, best);

      out_info->id          = DupString(info.id);
      out_info->version     = DupString(info.version);
      out_info->like        = DupString(info.like);
      out_info->codename    = DupString(info.codename);
      out_info->major       = DupString(info.versionParts.major);
      out_info->minor       = DupString(info.versionParts.minor);
      out_info->buildNumber = DupString(info.versionParts.buildNumber);
    } catch (const Exception& e) {
      error_at(e);
      DistroFreeVersionInfo(out_info);
      return TO_C_ERROR(InternalError);
    }

    return DISTRO_SUCCESS;
  }
}
