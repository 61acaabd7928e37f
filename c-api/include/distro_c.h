#ifndef DISTRO_C_H
#define DISTRO_C_H

#include <stdbool.h>

#if defined(DISTRO_C_SHARED)
  #define DISTRO_C_API __attribute__((visibility("default")))
#else
  #define DISTRO_C_API
#endif

#ifdef __cplusplus
  #define DISTRO_C_NOEXCEPT noexcept
#else
  #define DISTRO_C_NOEXCEPT
#endif

#ifdef __cplusplus
extern "C" {
#endif
  // Opaque handle wrapping a distro::core::Distribution
  typedef struct DistroHandle DistroHandle;

  // Error codes matching distro::utils::error::DistroErrorCode
  typedef enum DistroErrorCode {
    DISTRO_ERROR_API_UNAVAILABLE   = 0,
    DISTRO_ERROR_INTERNAL_ERROR    = 1,
    DISTRO_ERROR_INVALID_ARGUMENT  = 2,
    DISTRO_ERROR_IO_ERROR          = 3,
    DISTRO_ERROR_NOT_FOUND         = 4,
    DISTRO_ERROR_PARSE_ERROR       = 5,
    DISTRO_ERROR_PERMISSION_DENIED = 6,
    DISTRO_ERROR_OTHER             = 7,
    DISTRO_SUCCESS                 = 255 // Not an error - operation succeeded
  } DistroErrorCode;

  /**
   * Options for DistroCreate. NULL paths select the defaults.
   */
  typedef struct DistroOptions {
    bool        includeLsb;
    bool        includeUname;
    const char* osReleaseFile;
    const char* distroReleaseFile;
    const char* confDir;
  } DistroOptions;

  typedef struct DistroVersionInfo {
    char* id;
    char* version;
    char* like;
    char* codename;
    char* major;
    char* minor;
    char* buildNumber;
  } DistroVersionInfo;

  /**
   * Creates a resolver. Pass NULL for the defaults (every source enabled, /etc).
   * Must be destroyed with DistroDestroy.
   * @return The handle, or NULL if it could not be created.
   */
  DISTRO_C_API DistroHandle* DistroCreate(const DistroOptions* options) DISTRO_C_NOEXCEPT;

  /**
   * Destroys a resolver. NULL is ignored.
   */
  DISTRO_C_API void DistroDestroy(DistroHandle* handle) DISTRO_C_NOEXCEPT;

  /**
   * Frees a string returned by the library.
   */
  DISTRO_C_API void DistroFreeString(char* str) DISTRO_C_NOEXCEPT;

  /**
   * Frees a DistroVersionInfo struct's string members.
   */
  DISTRO_C_API void DistroFreeVersionInfo(DistroVersionInfo* info) DISTRO_C_NOEXCEPT;

  /**
   * The getters below return a newly allocated string that the caller frees with
   * DistroFreeString. Unknown values are returned as "". NULL is returned only when
   * the handle is NULL or allocation fails.
   */
  DISTRO_C_API char* DistroGetId(const DistroHandle* handle) DISTRO_C_NOEXCEPT;
  DISTRO_C_API char* DistroGetName(const DistroHandle* handle, bool pretty) DISTRO_C_NOEXCEPT;
  DISTRO_C_API char* DistroGetVersion(const DistroHandle* handle, bool pretty, bool best) DISTRO_C_NOEXCEPT;
  DISTRO_C_API char* DistroGetCodename(const DistroHandle* handle) DISTRO_C_NOEXCEPT;
  DISTRO_C_API char* DistroGetLike(const DistroHandle* handle) DISTRO_C_NOEXCEPT;

  /**
   * Raw attribute lookups, one per data source. Keys are lower-case.
   */
  DISTRO_C_API char* DistroGetOsReleaseAttr(const DistroHandle* handle, const char* attribute) DISTRO_C_NOEXCEPT;
  DISTRO_C_API char* DistroGetLsbReleaseAttr(const DistroHandle* handle, const char* attribute) DISTRO_C_NOEXCEPT;
  DISTRO_C_API char* DistroGetDistroReleaseAttr(const DistroHandle* handle, const char* attribute) DISTRO_C_NOEXCEPT;
  DISTRO_C_API char* DistroGetUnameAttr(const DistroHandle* handle, const char* attribute) DISTRO_C_NOEXCEPT;

  /**
   * Fills every field of the version info in one call.
   * @param out_info Pointer to struct to receive data. Caller must free with DistroFreeVersionInfo.
   * @return DISTRO_SUCCESS on success, error code otherwise.
   */
  DISTRO_C_API DistroErrorCode DistroGetInfo(const DistroHandle* handle, bool pretty, bool best, DistroVersionInfo* out_info) DISTRO_C_NOEXCEPT;
#ifdef __cplusplus
}
#endif

#endif // DISTRO_C_H
