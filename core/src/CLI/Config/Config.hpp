#pragma once

#include <filesystem> // std::filesystem::path

#include <Distro++/Core/Distribution.hpp>

#include <Distro++/Utils/Types.hpp>

namespace distro::config {
  /**
   * @struct Sources
   * @brief Which data sources to consult, and where to find them. Mirrors `[sources]`.
   */
  struct Sources {
    bool                          includeLsb   = true;
    bool                          includeUname = true;
    distro::utils::types::String  osReleaseFile;     ///< Empty = default location.
    distro::utils::types::String  distroReleaseFile; ///< Empty = discover.
    distro::utils::types::String  confDir;           ///< Empty = $UNIXCONFDIR or /etc.
  };

  /**
   * @struct Output
   * @brief How the report is printed. Mirrors `[output]`.
   */
  struct Output {
    bool json   = false; ///< Print JSON instead of the text report.
    bool pretty = false; ///< Include the codename in the version (`7.1.1503 (Core)`).
    bool best   = false; ///< Pick the most precise version across all sources.
  };

  /**
   * @struct Config
   * @brief Settings of the `distro` tool, read from a TOML file when one exists.
   *
   * @code{.toml}
   * [sources]
   * include_lsb = false
   * conf_dir = "/mnt/rootfs/etc"
   *
   * [output]
   * json = true
   * @endcode
   */
  struct Config {
    Sources sources;
    Output  output;

    /**
     * @brief Finds the first configuration file that exists.
     *
     * Searched in order: `$XDG_CONFIG_HOME/distro++/config.toml`,
     * `$HOME/.config/distro++/config.toml`, `$HOME/.distro++/config.toml`,
     * `./distro++.toml`.
     *
     * @return The path, or None when there is no configuration file.
     */
    static auto getConfigPath() -> distro::utils::types::Option<std::filesystem::path>;

    /**
     * @brief Parses the TOML file at @p path. Unknown keys are ignored.
     */
    static auto loadFrom(const std::filesystem::path& path) -> distro::utils::types::Result<Config>;

    /**
     * @brief Loads the configuration file if there is one; defaults otherwise.
     *
     * A file that cannot be read or parsed is reported and the defaults are used.
     */
    static auto getInstance() -> Config;

    /**
     * @brief The resolver options these settings describe.
     */
    [[nodiscard]] auto toDistributionOptions() const -> core::DistributionOptions;
  };
} // namespace distro::config
