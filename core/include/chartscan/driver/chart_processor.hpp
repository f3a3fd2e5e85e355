// chartscan/driver/chart_processor.hpp - Chart scan driver
//
// Single entry point for the scan pipeline. Used by the CLI and by tests
// (with a fake HelmClient).
//
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "chartscan/tooling/helm_client.hpp"
#include "chartscan/values/value.hpp"

namespace chartscan
{

class DiagnosticBag;
class Logger;

// ============================================================================
// Chart Stage
// ============================================================================

/**
 * Stages a chart passes through, strictly in this order.
 *
 * A failure while resolving dependencies or in the values file precheck
 * ends the scan at that point. Failures in later stages are accumulated.
 */
enum class ChartStage : uint8_t {
  Pending,
  DependenciesResolved,
  Linted,
  TemplatesParsed,
  ValuesLoaded,
  Resolved,
  Done,
};

[[nodiscard]] const char * to_string(ChartStage stage) noexcept;

// ============================================================================
// Scan Options / Results
// ============================================================================

struct ScanOptions
{
  /// Operator-supplied values files, lowest precedence first
  std::vector<std::filesystem::path> values_files;

  /// Maximum number of charts scanned at once (0 = hardware concurrency)
  unsigned jobs = 0;
};

/**
 * Outcome of scanning one chart. Built once, never modified afterwards.
 */
struct ChartResult
{
  std::string path;

  /// errors.empty()
  bool success = false;

  /// Every diagnostic in stage order; ends with the undefined-value messages
  std::vector<std::string> errors;

  /// Merged values (empty if the scan stopped before loading them)
  ValueMapping values;

  /// One message per unresolved reference
  std::vector<std::string> undefined_values;
};

/**
 * Thread-safe sink the workers hand their results to.
 */
class ResultCollector
{
public:
  void add(ChartResult result);

  [[nodiscard]] std::vector<ChartResult> take_results();
  [[nodiscard]] int invalid_count() const;

private:
  mutable std::mutex mutex_;
  std::vector<ChartResult> results_;
  int invalid_count_ = 0;
};

struct ScanReport
{
  /// In completion order; call sort_by_path() for a canonical order
  std::vector<ChartResult> results;
  int invalid_charts = 0;
  std::chrono::nanoseconds duration{0};

  void sort_by_path();
};

// ============================================================================
// ChartProcessor
// ============================================================================

/**
 * Scans charts for value references that do not resolve.
 *
 * Per chart the pipeline is:
 * 1. Dependency update (only if Chart.yaml declares dependencies)
 * 2. Existence check of the operator values files
 * 3. helm lint
 * 4. Reference extraction from templates/
 * 5. Loading and merging values.yaml and the operator values files
 * 6. Reference resolution
 */
class ChartProcessor
{
public:
  /**
   * @param helm Client used for dependency update and lint; must outlive
   *             the processor and tolerate concurrent calls
   * @param options Values files and parallelism
   * @param logger Optional progress logger
   */
  ChartProcessor(HelmClient & helm, ScanOptions options, Logger * logger = nullptr);

  /**
   * Scan a single chart. Never throws; unexpected failures become errors on
   * the returned result.
   */
  [[nodiscard]] ChartResult scan_chart(const std::filesystem::path & chart_dir) const;

  /**
   * Scan all charts concurrently. A failing chart never affects the others.
   */
  [[nodiscard]] ScanReport scan_charts(const std::vector<std::filesystem::path> & chart_dirs) const;

  /// Number of workers used for `chart_count` charts.
  [[nodiscard]] unsigned worker_count(size_t chart_count) const noexcept;

  [[nodiscard]] const ScanOptions & options() const noexcept { return options_; }

private:
  [[nodiscard]] ChartResult run_pipeline(const std::filesystem::path & chart_dir) const;

  /// Build the result; locations and help text of errors go to the verbose log.
  [[nodiscard]] ChartResult finish(
    const std::filesystem::path & chart_dir, const DiagnosticBag & diags) const;

  void enter_stage(const std::filesystem::path & chart_dir, ChartStage & current, ChartStage next) const;

  HelmClient & helm_;
  ScanOptions options_;
  Logger * logger_;
};

}  // namespace chartscan
