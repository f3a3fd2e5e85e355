// chartscan/chart/chart_manifest.hpp - Chart manifest (Chart.yaml)
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "chartscan/basic/diagnostic.hpp"

namespace chartscan
{

/// File that marks a directory as a chart root.
inline constexpr const char * k_chart_manifest_file_name = "Chart.yaml";

/// Default values file shipped inside a chart.
inline constexpr const char * k_chart_values_file_name = "values.yaml";

struct ChartDependency
{
  std::string name;
  std::string version;
  std::string repository;
};

struct ChartManifest
{
  std::string name;
  std::string version;
  std::vector<ChartDependency> dependencies;

  [[nodiscard]] bool has_dependencies() const noexcept { return !dependencies.empty(); }
};

/**
 * Result of loading a chart manifest.
 */
struct ManifestLoadResult
{
  ChartManifest manifest;
  bool success = false;

  /// ConfigError when the file could not be read, ParseError for bad YAML
  ErrorKind error_kind = ErrorKind::ConfigError;
  std::string error;

  static ManifestLoadResult ok(ChartManifest m)
  {
    ManifestLoadResult r;
    r.manifest = std::move(m);
    r.success = true;
    return r;
  }

  static ManifestLoadResult fail(ErrorKind kind, std::string msg)
  {
    ManifestLoadResult r;
    r.error_kind = kind;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load `<chart_dir>/Chart.yaml`.
 *
 * `dependencies` counts only when it is a non-empty sequence; any other
 * shape is treated as "no dependencies".
 */
[[nodiscard]] ManifestLoadResult load_chart_manifest(const std::filesystem::path & chart_dir);

/**
 * Chart name from the manifest, or nullopt if it cannot be read or has no
 * string `name`.
 */
[[nodiscard]] std::optional<std::string> read_chart_name(const std::filesystem::path & chart_dir);

}  // namespace chartscan
