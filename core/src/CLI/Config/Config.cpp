#include "Config.hpp"

#include <filesystem>     // std::filesystem::{path, operator/, is_regular_file}
#include <glaze/toml.hpp> // glz::{read, file_to_buffer, format_error, TOML}
#include <system_error>   // std::error_code

#include <Distro++/Utils/Env.hpp>
#include <Distro++/Utils/Error.hpp>
#include <Distro++/Utils/Logging.hpp>
#include <Distro++/Utils/Types.hpp>

using namespace distro::utils::types;
using enum distro::utils::error::DistroErrorCode;
using distro::utils::env::GetNonEmptyEnv;

namespace fs = std::filesystem;

// Intermediate structs for TOML parsing with glaze. Defaults match the library's.
namespace {
  struct TomlSources {
    bool   includeLsb   = true;
    bool   includeUname = true;
    String osReleaseFile;
    String distroReleaseFile;
    String confDir;
  };

  struct TomlOutput {
    bool json   = false;
    bool pretty = false;
    bool best   = false;
  };

  struct TomlConfig {
    TomlSources sources;
    TomlOutput  output;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlSources> {
  using T = TomlSources;

  // clang-format off
  static constexpr auto value = object(
    "include_lsb",         &T::includeLsb,
    "include_uname",       &T::includeUname,
    "os_release_file",     &T::osReleaseFile,
    "distro_release_file", &T::distroReleaseFile,
    "conf_dir",            &T::confDir
  );
  // clang-format on
};

template <>
struct glz::meta<TomlOutput> {
  using T                     = TomlOutput;
  static constexpr auto value = object("json", &T::json, "pretty", &T::pretty, "best", &T::best);
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("sources", &T::sources, "output", &T::output);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace distro::config {
  auto Config::getConfigPath() -> Option<fs::path> {
    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetNonEmptyEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "distro++" / "config.toml");

    if (Result<String> result = GetNonEmptyEnv("HOME")) {
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "distro++" / "config.toml");
      possiblePaths.emplace_back(fs::path(*result) / ".distro++" / "config.toml");
    }

    possiblePaths.emplace_back(fs::path(".") / "distro++.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::is_regular_file(path, errc) && !errc)
        return path;

    return None;
  }

  auto Config::loadFrom(const fs::path& path) -> Result<Config> {
    TomlConfig tomlCfg;
    String     buffer;

    glz::context ctx {};
    ctx.current_file = path.string();

    if (const auto fileError = glz::file_to_buffer(buffer, ctx.current_file); bool(fileError))
      ERR_FMT(IoError, "Failed to read config file {}", path.string());

    // Unknown keys are tolerated so older binaries accept newer files.
    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer, ctx))
      ERR_FMT(ParseError, "Failed to parse config file {}: {}", path.string(), glz::format_error(readError, buffer));

    Config cfg;

    cfg.sources = Sources {
      .includeLsb        = tomlCfg.sources.includeLsb,
      .includeUname      = tomlCfg.sources.includeUname,
      .osReleaseFile     = std::move(tomlCfg.sources.osReleaseFile),
      .distroReleaseFile = std::move(tomlCfg.sources.distroReleaseFile),
      .confDir           = std::move(tomlCfg.sources.confDir),
    };

    cfg.output = Output {
      .json   = tomlCfg.output.json,
      .pretty = tomlCfg.output.pretty,
      .best   = tomlCfg.output.best,
    };

    return cfg;
  }

  auto Config::getInstance() -> Config {
    const Option<fs::path> configPath = getConfigPath();

    if (!configPath) {
      debug_log("No config file found, using defaults");
      return {};
    }

    Result<Config> cfg = loadFrom(*configPath);

    if (!cfg) {
      warn_at(cfg.error());
      return {};
    }

    debug_log("Config loaded from {}", configPath->string());

    return std::move(*cfg);
  }

  auto Config::toDistributionOptions() const -> core::DistributionOptions {
    return core::DistributionOptions {
      .includeLsb        = sources.includeLsb,
      .includeUname      = sources.includeUname,
      .osReleaseFile     = sources.osReleaseFile,
      .distroReleaseFile = sources.distroReleaseFile,
      .confDir           = sources.confDir,
    };
  }
} // namespace distro::config
