// tests/unit/driver/test_chart_templater.cpp - Unit tests for `template` rendering
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "chartscan/basic/temp_dir.hpp"
#include "chartscan/driver/chart_templater.hpp"

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

std::string read_file(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class RenderingHelmClient final : public HelmClient
{
public:
  ToolOutput update_dependencies(const fs::path &, const fs::path &) override
  {
    ++update_calls;
    return update_result;
  }

  ToolOutput lint(const fs::path &, const std::vector<fs::path> &) override
  {
    return ToolOutput{true, 0, "", ""};
  }

  ToolOutput render(
    const std::string & release, const fs::path & chart,
    const std::vector<fs::path> & values_files) override
  {
    last_release = release;
    last_chart = chart;
    last_values = values_files;
    return render_result;
  }

  ToolOutput update_result{true, 0, "", ""};
  ToolOutput render_result{true, 0, "kind: Service\n", "kind: Service\n"};
  int update_calls = 0;
  std::string last_release;
  fs::path last_chart;
  std::vector<fs::path> last_values;
};

}  // namespace

// ============================================================================
// Release names
// ============================================================================

TEST(TemplaterReleaseName, Validation)
{
  EXPECT_TRUE(is_valid_release_name("web"));
  EXPECT_TRUE(is_valid_release_name("my-app-2"));
  EXPECT_TRUE(is_valid_release_name("a.b-c"));

  EXPECT_FALSE(is_valid_release_name(""));
  EXPECT_FALSE(is_valid_release_name("Web"));
  EXPECT_FALSE(is_valid_release_name("-web"));
  EXPECT_FALSE(is_valid_release_name("web-"));
  EXPECT_FALSE(is_valid_release_name("my_chart"));
}

TEST(TemplaterReleaseName, DerivedFromChartPath)
{
  EXPECT_EQ(release_name_for("charts/web"), "web");
  EXPECT_EQ(release_name_for("charts/web/"), "web");
  EXPECT_EQ(release_name_for("charts/./api/../web"), "web");
}

TEST(TemplaterReleaseName, DotUsesWorkingDirectory)
{
  EXPECT_EQ(release_name_for("."), fs::current_path().filename().string());
}

// ============================================================================
// template_chart
// ============================================================================

TEST(TemplaterTemplateChart, WritesManifestToStream)
{
  ScopedTempDir tmp("chartscan_test");
  const fs::path chart = tmp.path() / "web";
  write_file(chart / "Chart.yaml", "apiVersion: v2\nname: web\nversion: 0.1.0\n");

  RenderingHelmClient helm;
  std::ostringstream os;
  const std::vector<fs::path> values{tmp.path() / "prod.yaml"};
  const TemplateResult result = template_chart(helm, chart, values, std::nullopt, os);

  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(os.str(), "kind: Service\n\n");
  EXPECT_EQ(helm.last_release, "web");
  EXPECT_EQ(helm.last_values, values);
  EXPECT_EQ(helm.update_calls, 0);
}

TEST(TemplaterTemplateChart, AppendsToOutputFile)
{
  ScopedTempDir tmp("chartscan_test");
  const fs::path chart = tmp.path() / "web";
  write_file(chart / "Chart.yaml", "apiVersion: v2\nname: web\nversion: 0.1.0\n");
  const fs::path out_file = tmp.path() / "rendered.yaml";

  RenderingHelmClient helm;
  std::ostringstream os;
  ASSERT_TRUE(template_chart(helm, chart, {}, out_file, os).success);
  ASSERT_TRUE(template_chart(helm, chart, {}, out_file, os).success);

  EXPECT_TRUE(os.str().empty());
  EXPECT_EQ(read_file(out_file), "kind: Service\n\nkind: Service\n\n");
}

TEST(TemplaterTemplateChart, InvalidReleaseName)
{
  ScopedTempDir tmp("chartscan_test");
  const fs::path chart = tmp.path() / "My_Chart";
  write_file(chart / "Chart.yaml", "apiVersion: v2\nname: x\nversion: 0.1.0\n");

  RenderingHelmClient helm;
  std::ostringstream os;
  const TemplateResult result = template_chart(helm, chart, {}, std::nullopt, os);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid release name: My_Chart");
  EXPECT_TRUE(helm.last_release.empty());
}

TEST(TemplaterTemplateChart, EmptyPath)
{
  RenderingHelmClient helm;
  std::ostringstream os;
  const TemplateResult result = template_chart(helm, fs::path(), {}, std::nullopt, os);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "chart path is empty");
}

TEST(TemplaterTemplateChart, RenderFailureCarriesStderr)
{
  ScopedTempDir tmp("chartscan_test");
  const fs::path chart = tmp.path() / "web";
  write_file(chart / "Chart.yaml", "apiVersion: v2\nname: web\nversion: 0.1.0\n");

  RenderingHelmClient helm;
  helm.render_result = ToolOutput{false, 1, "partial\nError: parse error\n", "partial\n"};
  std::ostringstream os;
  const TemplateResult result = template_chart(helm, chart, {}, std::nullopt, os);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "error running helm template: exit status 1\nstderr: Error: parse error\n");
  EXPECT_TRUE(os.str().empty());
}

TEST(TemplaterTemplateChart, DependencyFailure)
{
  ScopedTempDir tmp("chartscan_test");
  const fs::path chart = tmp.path() / "umbrella";
  write_file(
    chart / "Chart.yaml",
    "apiVersion: v2\nname: umbrella\nversion: 0.1.0\ndependencies:\n  - name: redis\n    version: 1.0.0\n");

  RenderingHelmClient helm;
  helm.update_result = ToolOutput{false, 2, "Error: offline\n", ""};
  std::ostringstream os;
  const TemplateResult result = template_chart(helm, chart, {}, std::nullopt, os);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "error building dependencies: [Error updating dependencies: exit status 2]");
  EXPECT_EQ(helm.update_calls, 1);
  EXPECT_TRUE(helm.last_release.empty());
}
