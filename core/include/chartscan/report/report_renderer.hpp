// chartscan/report/report_renderer.hpp - Scan report output
//
// Renders a ScanReport as a terminal table, JSON, YAML or a JUnit XML test
// suite. All renderers write to the given stream and never reorder the
// results they are handed.
//
#pragma once

#include <chrono>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "chartscan/driver/chart_processor.hpp"
#include "chartscan/report/output_format.hpp"
#include "chartscan/values/value.hpp"

namespace chartscan
{

struct ScanConfig;

// ============================================================================
// Constants
// ============================================================================

inline constexpr const char * k_junit_suite_name = "Helm Chart Scan";
inline constexpr const char * k_junit_class_name = "ChartScan";
inline constexpr const char * k_junit_failure_message = "Chart rendering failed";
inline constexpr const char * k_junit_failure_type = "RenderingError";

// ============================================================================
// Renderers
// ============================================================================

/**
 * Bordered table (Chart Name, Success, Details) followed by a summary line.
 *
 * The chart name comes from the chart's Chart.yaml, falling back to the
 * chart path. Each error is a `• ` bullet; long lines wrap at 120 columns.
 */
void render_pretty(std::ostream & os, const ScanReport & report, bool use_color);

/// Indented JSON array; empty Errors, UndefinedValues and Values are omitted.
void render_json(std::ostream & os, const std::vector<ChartResult> & results);

/// YAML sequence with the same keys as render_json.
void render_yaml(std::ostream & os, const std::vector<ChartResult> & results);

/// JUnit `<testsuite>` with one `<testcase>` per chart.
void render_junit(std::ostream & os, const ScanReport & report);

/// Dispatch on `format`.
void render_report(std::ostream & os, const ScanReport & report, OutputFormat format, bool use_color);

/**
 * Two-column table of configured environments and their values files, or
 * "No environments configured." when there are none.
 */
void render_environments(std::ostream & os, const ScanConfig & config, bool use_color);

// ============================================================================
// Helpers
// ============================================================================

/**
 * Human-readable duration: "0s", "850ns", "1.5µs", "12.0345ms", "2.5s",
 * "1m30s", "2h0m5s".
 */
[[nodiscard]] std::string format_duration(std::chrono::nanoseconds duration);

/**
 * Details cell for one chart: each error on a `• ` bullet, literal "\n"
 * sequences expanded, lines wrapped at `width` with continuation lines
 * indented by two spaces.
 */
[[nodiscard]] std::string format_error_details(
  const std::vector<std::string> & errors, size_t width);

/// Typed JSON for a values tree (integers, floats and booleans unquoted).
[[nodiscard]] nlohmann::ordered_json values_to_json(const ValueMapping & values);

}  // namespace chartscan
