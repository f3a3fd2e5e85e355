// chartscan - Helm chart values reference scanner
//
// Usage:
//   chartscan scan <chart-path>... [-f values] [-o format] [-e env] [-c config]
//   chartscan template <chart-path>... [-f values] [-o file] [-e env] [-c config]
//   chartscan version
//   chartscan -l [-c config]
//
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include "chartscan/basic/logger.hpp"
#include "chartscan/chart/chart_finder.hpp"
#include "chartscan/driver/chart_processor.hpp"
#include "chartscan/driver/chart_templater.hpp"
#include "chartscan/project/scan_config.hpp"
#include "chartscan/report/output_format.hpp"
#include "chartscan/report/report_renderer.hpp"
#include "chartscan/tooling/helm_client.hpp"

#ifndef CHARTSCAN_VERSION
#define CHARTSCAN_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;

namespace
{

constexpr unsigned long k_max_jobs = 1024;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "ChartScan " << CHARTSCAN_VERSION << "\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  scan <chart-path>...       Scan Helm charts for undefined values\n"
            << "  template <chart-path>...   Render Helm charts using helm template\n"
            << "  version                    Print the version of ChartScan\n\n"
            << "Options:\n"
            << "  -f, --values <file>        Values file (repeatable, comma-separated)\n"
            << "  -o, --output-format <fmt>  scan: pretty | json | yaml | junit\n"
            << "  -o, --output <file>        template: append rendered output to file\n"
            << "  -e, --environment <name>   Use the values files of an environment\n"
            << "  -c, --config <path>        Path to chartscan.yaml\n"
            << "  -l, --list-environments    List configured environments\n"
            << "  -j, --jobs <n>             Charts scanned in parallel (default: CPU count)\n"
            << "      --helm <path>          helm executable (default: helm)\n"
            << "      --no-color             Disable colored output\n"
            << "  -v, --verbose              Verbose output\n"
            << "  -q, --quiet                Only print errors and the report\n"
            << "  -h, --help                 Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::vector<std::string> values_files;
  std::string output;
  std::string environment;
  std::string config_path;
  std::string helm_executable = "helm";
  unsigned jobs = 0;
  bool list_environments = false;
  bool no_color = false;
  bool verbose = false;
  bool quiet = false;
  bool show_help = false;

  /// Set when the command line is malformed
  std::string error;
};

void split_comma_list(const std::string & value, std::vector<std::string> & out)
{
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(',', start);
    if (end == std::string::npos) {
      end = value.size();
    }
    if (end > start) {
      out.push_back(value.substr(start, end - start));
    }
    start = end + 1;
  }
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  int first = 1;
  const std::string head = argv[1];
  if (head.empty() || head[0] != '-') {
    args.command = head;
    first = 2;
  }

  for (int i = first; i < argc && args.error.empty(); ++i) {
    const std::string arg = argv[i];

    auto take_value = [&](std::string & dest) {
      if (i + 1 < argc) {
        dest = argv[++i];
      } else {
        args.error = "option '" + arg + "' requires a value";
      }
    };

    if (arg == "-f" || arg == "--values") {
      std::string value;
      take_value(value);
      split_comma_list(value, args.values_files);
    } else if (arg == "-o" || arg == "--output-format" || arg == "--output") {
      take_value(args.output);
    } else if (arg == "-e" || arg == "--environment") {
      take_value(args.environment);
    } else if (arg == "-c" || arg == "--config") {
      take_value(args.config_path);
    } else if (arg == "--helm") {
      take_value(args.helm_executable);
    } else if (arg == "-j" || arg == "--jobs") {
      std::string value;
      take_value(value);
      if (args.error.empty()) {
        const bool digits = !value.empty() && value.size() <= 4 &&
                            std::all_of(value.begin(), value.end(), [](unsigned char c) {
                              return std::isdigit(c) != 0;
                            });
        if (digits && std::stoul(value) <= k_max_jobs) {
          args.jobs = static_cast<unsigned>(std::stoul(value));
        } else {
          args.error = "invalid value for " + arg + ": " + value;
        }
      }
    } else if (arg == "-l" || arg == "--list-environments") {
      args.list_environments = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-q" || arg == "--quiet") {
      args.quiet = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/// Explicit --config, else chartscan.yaml found upward from the working directory.
std::optional<chartscan::ScanConfig> load_config(
  const CommandArgs & args, chartscan::Logger & logger, bool & failed)
{
  failed = false;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
      config_path = chartscan::find_scan_config(cwd);
      if (config_path) {
        logger.info("Using config file from project root: {}", config_path->string());
      }
    }
  }

  if (!config_path) {
    return chartscan::ScanConfig{};
  }

  auto result = chartscan::load_scan_config(*config_path);
  if (!result.success) {
    logger.error("Error loading config: {}", result.error);
    failed = true;
    return std::nullopt;
  }
  return std::move(result.config);
}

std::optional<chartscan::ResolvedScanOptions> resolve_options(
  const CommandArgs & args, const chartscan::ScanConfig & config, bool format_flag,
  chartscan::Logger & logger)
{
  chartscan::ScanOverrides overrides;
  for (const auto & f : args.values_files) {
    overrides.values_files.emplace_back(f);
  }
  if (!args.environment.empty()) {
    overrides.environment = args.environment;
  }
  if (format_flag && !args.output.empty()) {
    overrides.format = chartscan::parse_output_format(args.output);
    if (!overrides.format) {
      logger.error("Unknown output format: {}", args.output);
      return std::nullopt;
    }
  }

  auto resolved = chartscan::resolve_scan_options(config, overrides);
  if (!resolved.success) {
    logger.error("Error loading config: {}", resolved.error);
    return std::nullopt;
  }
  return std::move(resolved.options);
}

std::vector<fs::path> chart_inputs(
  const CommandArgs & args, const chartscan::ResolvedScanOptions & options)
{
  std::vector<fs::path> inputs;
  for (const auto & in : args.inputs) {
    inputs.emplace_back(in);
  }
  if (inputs.empty() && options.chart_path) {
    inputs.push_back(*options.chart_path);
  }
  return inputs;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_scan(const CommandArgs & args, chartscan::Logger & logger, bool use_color)
{
  bool failed = false;
  const auto config = load_config(args, logger, failed);
  if (failed) {
    return 1;
  }

  const auto options = resolve_options(args, *config, true, logger);
  if (!options) {
    return 1;
  }

  const std::vector<fs::path> inputs = chart_inputs(args, *options);
  if (inputs.empty()) {
    logger.error("chart path required");
    std::cerr << "usage: chartscan scan <chart-path>... [options]\n";
    return 1;
  }

  std::vector<fs::path> chart_dirs;
  for (const auto & input : inputs) {
    const auto found = chartscan::find_chart_dirs(input);
    if (!found.success) {
      logger.error("Error finding Helm charts in {}: {}", input.string(), found.error);
      return 1;
    }
    chart_dirs.insert(chart_dirs.end(), found.chart_dirs.begin(), found.chart_dirs.end());
  }

  chartscan::ProcessHelmClient helm(args.helm_executable);
  chartscan::ScanOptions scan_options;
  scan_options.values_files = options->values_files;
  scan_options.jobs = args.jobs;

  const chartscan::ChartProcessor processor(helm, scan_options, &logger);
  chartscan::ScanReport report = processor.scan_charts(chart_dirs);
  report.sort_by_path();

  try {
    chartscan::render_report(std::cout, report, options->format, use_color);
  } catch (const std::exception & e) {
    logger.error("Error processing results: {}", e.what());
    return 1;
  }
  std::cout.flush();

  return report.invalid_charts > 0 ? 1 : 0;
}

int cmd_template(const CommandArgs & args, chartscan::Logger & logger)
{
  bool failed = false;
  const auto config = load_config(args, logger, failed);
  if (failed) {
    return 1;
  }

  const auto options = resolve_options(args, *config, false, logger);
  if (!options) {
    return 1;
  }

  const std::vector<fs::path> inputs = chart_inputs(args, *options);
  if (inputs.empty()) {
    logger.error("chart path required");
    std::cerr << "usage: chartscan template <chart-path>... [options]\n";
    return 1;
  }

  std::optional<fs::path> output_file;
  if (!args.output.empty()) {
    output_file = fs::path(args.output);
  }

  chartscan::ProcessHelmClient helm(args.helm_executable);
  for (const auto & chart : inputs) {
    logger.verbose("Templating: {}", chart.string());
    const auto result =
      chartscan::template_chart(helm, chart, options->values_files, output_file, std::cout);
    if (!result.success) {
      logger.error("Error rendering chart {}: {}", chart.string(), result.error);
      return 1;
    }
  }
  return 0;
}

int cmd_list_environments(const CommandArgs & args, chartscan::Logger & logger, bool use_color)
{
  bool failed = false;
  const auto config = load_config(args, logger, failed);
  if (failed) {
    logger.error("Error listing environments");
    return 1;
  }
  chartscan::render_environments(std::cout, *config, use_color);
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  const bool stderr_color = !args.no_color && isatty(fileno(stderr)) != 0;
  const bool stdout_color = !args.no_color && isatty(fileno(stdout)) != 0;

  chartscan::LogLevel level = chartscan::LogLevel::Normal;
  if (args.verbose) {
    level = chartscan::LogLevel::Verbose;
  } else if (args.quiet) {
    level = chartscan::LogLevel::Quiet;
  }
  chartscan::Logger logger(std::cerr, level, stderr_color);

  if (!args.error.empty()) {
    logger.error("{}", args.error);
    print_usage(argv[0]);
    return 1;
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.list_environments) {
    return cmd_list_environments(args, logger, stdout_color);
  }

  if (args.command == "scan") {
    return cmd_scan(args, logger, stdout_color);
  }

  if (args.command == "template") {
    return cmd_template(args, logger);
  }

  if (args.command == "version") {
    std::cout << "ChartScan version " << CHARTSCAN_VERSION << "\n";
    return 0;
  }

  if (args.command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  logger.error("unknown command '{}'", args.command);
  print_usage(argv[0]);
  return 1;
}
