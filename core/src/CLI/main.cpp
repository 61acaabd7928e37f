#include <cstdlib> // EXIT_SUCCESS, EXIT_FAILURE
#include <format>  // std::format

#include <Distro++/Core/Distribution.hpp>

#include <Distro++/Utils/ArgumentParser.hpp>
#include <Distro++/Utils/Error.hpp>
#include <Distro++/Utils/Logging.hpp>
#include <Distro++/Utils/Types.hpp>

#include "CLI.hpp"
#include "Config/Config.hpp"
#include "Core/Report.hpp"

using namespace distro::utils::types;
using namespace distro::utils::logging;
using namespace distro::config;
using namespace distro::cli;

struct CliOptions {
  bool noLsb       = false;
  bool noUname     = false;
  bool showSources = false;
};

auto main(const i32 argc, CStr* argv[]) -> i32 try {
  using distro::utils::argparse::ArgumentParser;

  CliOptions opts;
  Config     config;

  ArgumentParser parser("distro", std::format("distro++ {}", DISTRO_VERSION));

  parser
    .addArguments("-V", "--verbose")
    .help("Enable verbose logging. Overrides --log-level.")
    .flag();

  parser
    .addArguments("-l", "--log-level")
    .help("Set the minimum log level.")
    .metavar("LEVEL")
    .defaultValue(LogLevel::Info);

  parser
    .addArguments("-j", "--json")
    .help("Output the distribution information as JSON.")
    .flag()
    .overrides(config.output.json);

  parser
    .addArguments("--pretty")
    .help("Include the codename in the version (e.g. '7.1.1503 (Core)') and pretty-print JSON output.")
    .flag()
    .overrides(config.output.pretty);

  parser
    .addArguments("--best")
    .help("Use the most precise version found across all data sources.")
    .flag()
    .overrides(config.output.best);

  parser
    .addArguments("--no-lsb")
    .help("Do not run `lsb_release -a`.")
    .flag()
    .bindTo(opts.noLsb);

  parser
    .addArguments("--no-uname")
    .help("Do not run `uname -rs`.")
    .flag()
    .bindTo(opts.noUname);

  parser
    .addArguments("--os-release-file")
    .help("Read this file instead of the default os-release.")
    .metavar("PATH")
    .overrides(config.sources.osReleaseFile);

  parser
    .addArguments("--distro-release-file")
    .help("Read this legacy release file instead of searching for one.")
    .metavar("PATH")
    .overrides(config.sources.distroReleaseFile);

  parser
    .addArguments("--conf-dir")
    .help("Directory holding os-release and the legacy release files. Defaults to $UNIXCONFDIR or /etc.")
    .metavar("DIR")
    .overrides(config.sources.confDir);

  parser
    .addArguments("--sources")
    .help("Also print the raw attributes read from every data source.")
    .flag()
    .bindTo(opts.showSources);

  parser
    .addArguments("--show-config-path")
    .help("Display the active configuration file location.")
    .flag();

  const Vec<String> args(argv, argv + argc);

  if (Result<> result = parser.parseArgs(Span<const String>(args)); !result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  if (parser.helpRequested()) {
    Print("{}", parser.helpText());
    return EXIT_SUCCESS;
  }

  if (parser.versionRequested()) {
    Println("{}", parser.getVersion());
    return EXIT_SUCCESS;
  }

  SetRuntimeLogLevel(
    parser.get<bool>("--verbose")
      ? LogLevel::Debug
      : parser.getEnum<LogLevel>("--log-level")
  );

  if (parser.get<bool>("--show-config-path")) {
    if (const auto configPath = Config::getConfigPath())
      Println("{}", configPath->string());
    else
      Println("No configuration file found; using defaults.");

    return EXIT_SUCCESS;
  }

  // The file supplies the baseline, then options given on the command line win.
  config = Config::getInstance();
  parser.applyBindings();

  if (opts.noLsb)
    config.sources.includeLsb = false;

  if (opts.noUname)
    config.sources.includeUname = false;

  const distro::core::Distribution dist(config.toDistributionOptions());

  if (config.output.json) {
    const JsonReport report = BuildJsonReport(dist, config.output.pretty, config.output.best, opts.showSources);

    Result<String> json = FormatJsonReport(report, config.output.pretty);

    if (!json) {
      error_at(json.error());
      return EXIT_FAILURE;
    }

    Println("{}", *json);
    return EXIT_SUCCESS;
  }

  Print("{}", FormatTextReport(dist, config.output.best));

  if (opts.showSources) {
    Println();
    Print("{}", FormatSourcesText(dist));
  }

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
