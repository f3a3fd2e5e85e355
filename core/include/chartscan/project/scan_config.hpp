// chartscan/project/scan_config.hpp - Scan configuration (chartscan.yaml)
//
// Parses chartscan.yaml and layers it with environment selection and
// command line overrides. Used by both the scan and template commands.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "chartscan/report/output_format.hpp"

namespace chartscan
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Named set of values files (environments.<name> in chartscan.yaml).
 */
struct EnvironmentConfig
{
  std::vector<std::filesystem::path> values_files;
};

/**
 * Complete scan configuration (chartscan.yaml).
 *
 * Relative paths are already resolved against config_dir when loaded from a
 * file.
 */
struct ScanConfig
{
  /// Chart or chart tree scanned when no path is given on the command line
  std::optional<std::filesystem::path> chart_path;

  /// Default values files, lowest precedence first
  std::vector<std::filesystem::path> values_files;

  std::optional<OutputFormat> format;

  /// Sorted by environment name
  std::map<std::string, EnvironmentConfig> environments;

  /// Directory containing chartscan.yaml (empty for a default config)
  std::filesystem::path config_dir;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ScanConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ScanConfig config;

  bool success = false;

  std::string error;

  static ScanConfigLoadResult ok(ScanConfig cfg)
  {
    ScanConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ScanConfigLoadResult fail(std::string msg)
  {
    ScanConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Option Resolution
// ============================================================================

/**
 * Values given on the command line. Anything set here wins over the config.
 */
struct ScanOverrides
{
  /// Replaces the configured values files when non-empty
  std::vector<std::filesystem::path> values_files;

  std::optional<OutputFormat> format;

  /// Environment whose values files replace the top-level ones
  std::optional<std::string> environment;
};

struct ResolvedScanOptions
{
  std::vector<std::filesystem::path> values_files;
  OutputFormat format = OutputFormat::Pretty;
  std::optional<std::filesystem::path> chart_path;
};

struct ResolveResult
{
  ResolvedScanOptions options;
  bool success = false;
  std::string error;

  static ResolveResult ok(ResolvedScanOptions opts)
  {
    ResolveResult r;
    r.options = std::move(opts);
    r.success = true;
    return r;
  }

  static ResolveResult fail(std::string msg)
  {
    ResolveResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// API
// ============================================================================

/**
 * Load a scan configuration from a chartscan.yaml file.
 *
 * @param config_path Path to chartscan.yaml
 * @return ScanConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ScanConfigLoadResult load_scan_config(const std::filesystem::path & config_path);

/**
 * Find chartscan.yaml by searching upward from a directory.
 *
 * The search stops after the first directory that contains `.git` (the
 * repository root) or at the filesystem root.
 *
 * @param start_dir Directory to start searching from
 * @return Path to chartscan.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_scan_config(
  const std::filesystem::path & start_dir);

/**
 * Apply precedence: config file, then the selected environment, then the
 * command line. An unknown environment is an error.
 */
[[nodiscard]] ResolveResult resolve_scan_options(
  const ScanConfig & config, const ScanOverrides & overrides);

/**
 * Default name of the scan configuration file.
 */
inline constexpr const char * k_scan_config_file_name = "chartscan.yaml";

}  // namespace chartscan
