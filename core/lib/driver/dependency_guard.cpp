// chartscan/driver/dependency_guard.cpp - Chart dependency update and cleanup
//
#include "chartscan/driver/dependency_guard.hpp"

#include <optional>
#include <string>
#include <system_error>

#include "chartscan/basic/temp_dir.hpp"
#include "chartscan/chart/chart_manifest.hpp"

namespace fs = std::filesystem;

namespace chartscan
{

DependencyArtifactsGuard::DependencyArtifactsGuard(const fs::path & chart_dir)
: charts_dir_(chart_dir / "charts"), lock_file_(chart_dir / "Chart.lock")
{
  std::error_code ec;
  had_charts_dir_ = fs::exists(charts_dir_, ec);
  had_lock_file_ = fs::exists(lock_file_, ec);
}

DependencyArtifactsGuard::~DependencyArtifactsGuard()
{
  if (!armed_) {
    return;
  }
  std::error_code ec;
  if (!had_charts_dir_) {
    fs::remove_all(charts_dir_, ec);
  }
  if (!had_lock_file_) {
    fs::remove(lock_file_, ec);
  }
}

bool resolve_dependencies(
  HelmClient & helm, const fs::path & chart_dir, DependencyArtifactsGuard & artifacts,
  DiagnosticBag & diags)
{
  const ManifestLoadResult manifest = load_chart_manifest(chart_dir);
  if (!manifest.success) {
    diags.report_error(manifest.error_kind, "Error reading Chart.yaml: " + manifest.error)
      .with_location(chart_dir / k_chart_manifest_file_name);
    return false;
  }

  if (!manifest.manifest.has_dependencies()) {
    return true;
  }

  std::optional<ScopedTempDir> cache_dir;
  try {
    cache_dir.emplace(k_cache_dir_prefix);
  } catch (const fs::filesystem_error & e) {
    diags.report_error(
      ErrorKind::ConfigError, "Error creating temp cache dir: " + std::string(e.what()));
    return false;
  }

  artifacts.arm();
  const ToolOutput out = helm.update_dependencies(chart_dir, cache_dir->path());
  if (!out.success) {
    diags
      .report_error(
        ErrorKind::ExternalToolError,
        "Error updating dependencies: exit status " + std::to_string(out.exit_code))
      .with_help(out.output);
    return false;
  }

  return true;
}

}  // namespace chartscan
