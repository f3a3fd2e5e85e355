// chartscan/driver/dependency_guard.hpp - Chart dependency update and cleanup
//
// Shared by the scan pipeline and the template command.
//
#pragma once

#include <filesystem>

#include "chartscan/basic/diagnostic.hpp"
#include "chartscan/tooling/helm_client.hpp"

namespace chartscan
{

/// Prefix of the temporary repository cache used by `helm dependency update`.
inline constexpr const char * k_cache_dir_prefix = "chartscan";

/**
 * Removes what `helm dependency update` left in a chart (the `charts/`
 * directory and `Chart.lock`) when destroyed. Only armed guards clean up,
 * and files that existed before the guard was created are left alone.
 */
class DependencyArtifactsGuard
{
public:
  explicit DependencyArtifactsGuard(const std::filesystem::path & chart_dir);
  ~DependencyArtifactsGuard();

  DependencyArtifactsGuard(const DependencyArtifactsGuard &) = delete;
  DependencyArtifactsGuard & operator=(const DependencyArtifactsGuard &) = delete;

  void arm() noexcept { armed_ = true; }
  [[nodiscard]] bool armed() const noexcept { return armed_; }

private:
  std::filesystem::path charts_dir_;
  std::filesystem::path lock_file_;
  bool had_charts_dir_ = false;
  bool had_lock_file_ = false;
  bool armed_ = false;
};

/**
 * Read the chart's Chart.yaml and, if it declares dependencies, run
 * `helm dependency update` against a temporary repository cache that is
 * removed before returning.
 *
 * Arms `artifacts` before helm runs. Reports to `diags` and returns false on
 * any failure.
 */
[[nodiscard]] bool resolve_dependencies(
  HelmClient & helm, const std::filesystem::path & chart_dir, DependencyArtifactsGuard & artifacts,
  DiagnosticBag & diags);

}  // namespace chartscan
