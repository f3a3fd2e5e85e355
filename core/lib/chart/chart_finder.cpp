// chartscan/chart/chart_finder.cpp - Chart root discovery implementation
//
#include "chartscan/chart/chart_finder.hpp"

#include <algorithm>
#include <system_error>

#include "chartscan/chart/chart_manifest.hpp"

namespace fs = std::filesystem;

namespace chartscan
{

namespace
{

bool is_chart_root(const fs::path & dir)
{
  std::error_code ec;
  return fs::is_regular_file(dir / k_chart_manifest_file_name, ec);
}

}  // namespace

ChartSearchResult find_chart_dirs(const fs::path & root)
{
  if (root.empty()) {
    return ChartSearchResult::ok({});
  }

  std::error_code ec;
  const fs::file_status st = fs::status(root, ec);
  if (!fs::exists(st)) {
    return ChartSearchResult::fail(
      "lstat " + root.string() + ": " + (ec ? ec.message() : "no such file or directory"));
  }
  if (!fs::is_directory(st)) {
    return ChartSearchResult::ok({});
  }

  std::vector<fs::path> dirs;
  if (is_chart_root(root)) {
    dirs.push_back(root);
  }

  fs::recursive_directory_iterator it(root, ec);
  if (ec) {
    return ChartSearchResult::fail("open " + root.string() + ": " + ec.message());
  }
  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return ChartSearchResult::fail(ec.message());
    }
    const fs::file_status entry_status = it->symlink_status(ec);
    if (ec) {
      return ChartSearchResult::fail("lstat " + it->path().string() + ": " + ec.message());
    }
    if (fs::is_directory(entry_status) && is_chart_root(it->path())) {
      dirs.push_back(it->path());
    }
  }
  if (ec) {
    return ChartSearchResult::fail(ec.message());
  }

  std::sort(dirs.begin(), dirs.end());
  return ChartSearchResult::ok(std::move(dirs));
}

}  // namespace chartscan
