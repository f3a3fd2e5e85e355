// tests/unit/chart/test_chart_finder.cpp - Unit tests for chart discovery

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "chartscan/basic/temp_dir.hpp"
#include "chartscan/chart/chart_finder.hpp"

namespace fs = std::filesystem;
using namespace chartscan;

namespace
{

void write_file(const fs::path & p, const std::string & content)
{
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << content;
}

}  // namespace

TEST(ChartFinder, FindsNestedChartsSorted)
{
  const ScopedTempDir root("chartscan_test");
  write_file(root.path() / "charts" / "web" / "Chart.yaml", "name: web\n");
  write_file(root.path() / "charts" / "api" / "Chart.yaml", "name: api\n");
  write_file(root.path() / "docs" / "README.md", "not a chart\n");

  const auto result = find_chart_dirs(root.path());
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.chart_dirs.size(), 2U);
  EXPECT_EQ(result.chart_dirs[0], root.path() / "charts" / "api");
  EXPECT_EQ(result.chart_dirs[1], root.path() / "charts" / "web");
}

TEST(ChartFinder, IncludesRootItself)
{
  const ScopedTempDir root("chartscan_test");
  write_file(root.path() / "Chart.yaml", "name: umbrella\n");
  write_file(root.path() / "charts" / "sub" / "Chart.yaml", "name: sub\n");

  const auto result = find_chart_dirs(root.path());
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.chart_dirs.size(), 2U);
  EXPECT_EQ(result.chart_dirs[0], root.path());
  EXPECT_EQ(result.chart_dirs[1], root.path() / "charts" / "sub");
}

TEST(ChartFinder, ChartYamlDirectoryIsNotAChart)
{
  const ScopedTempDir root("chartscan_test");
  fs::create_directories(root.path() / "odd" / "Chart.yaml");

  const auto result = find_chart_dirs(root.path());
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.chart_dirs.empty());
}

TEST(ChartFinder, EmptyTreeYieldsNoCharts)
{
  const ScopedTempDir root("chartscan_test");
  const auto result = find_chart_dirs(root.path());
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.chart_dirs.empty());
}

TEST(ChartFinder, NonexistentRootFails)
{
  const ScopedTempDir root("chartscan_test");
  const auto result = find_chart_dirs(root.path() / "missing");
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error.empty());
}
