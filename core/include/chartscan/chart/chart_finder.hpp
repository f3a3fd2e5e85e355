// chartscan/chart/chart_finder.hpp - Chart root discovery
//
#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace chartscan
{

struct ChartSearchResult
{
  /// Chart roots in lexical order
  std::vector<std::filesystem::path> chart_dirs;
  bool success = false;
  std::string error;

  static ChartSearchResult ok(std::vector<std::filesystem::path> dirs)
  {
    ChartSearchResult r;
    r.chart_dirs = std::move(dirs);
    r.success = true;
    return r;
  }

  static ChartSearchResult fail(std::string msg)
  {
    ChartSearchResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Find every directory under `root` (including `root` itself) that contains
 * a regular `Chart.yaml` file.
 *
 * Charts nested inside other charts (e.g. vendored subcharts under
 * `charts/`) are reported as well. Symlinked directories are not followed.
 *
 * @param root Directory to search
 * @return Chart roots, or an error if `root` cannot be walked
 */
[[nodiscard]] ChartSearchResult find_chart_dirs(const std::filesystem::path & root);

}  // namespace chartscan
