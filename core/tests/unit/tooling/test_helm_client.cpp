// tests/unit/tooling/test_helm_client.cpp - Unit tests for the helm subprocess client

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "chartscan/basic/temp_dir.hpp"
#include "chartscan/tooling/helm_client.hpp"

namespace fs = std::filesystem;
using namespace chartscan;

namespace
{

/// Stand-in helm that prints its arguments and fails when asked to lint "bad".
fs::path write_fake_helm(const fs::path & dir)
{
  const fs::path script = dir / "helm";
  {
    std::ofstream out(script);
    out << "#!/bin/sh\n"
           "echo \"$@\"\n"
           "case \"$3\" in\n"
           "  */bad) echo '[ERROR] templates/: parse error' 1>&2; exit 1 ;;\n"
           "esac\n"
           "exit 0\n";
  }
  fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
  return script;
}

}  // namespace

// ============================================================================
// Output filtering
// ============================================================================

TEST(ToolingHelmOutput, ErrorLinesVerbatimInOrder)
{
  const std::string output =
    "==> Linting ./web\n"
    "[ERROR] Chart.yaml: version is required\n"
    "[WARNING] templates/: icon is recommended\n"
    "[ERROR] templates/: parse error at (web/templates/svc.yaml:3)\n"
    "Error: 1 chart(s) linted, 1 chart(s) failed";

  const std::vector<std::string> expected{
    "[ERROR] Chart.yaml: version is required",
    "[ERROR] templates/: parse error at (web/templates/svc.yaml:3)",
  };
  EXPECT_EQ(parse_error_lines(output), expected);

  const auto warnings = filter_marked_lines(output, k_warning_marker);
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0], "[WARNING] templates/: icon is recommended");
}

TEST(ToolingHelmOutput, NoMarkerNoLines)
{
  EXPECT_TRUE(parse_error_lines("").empty());
  EXPECT_TRUE(parse_error_lines("Error: failed\n").empty());
}

// ============================================================================
// ProcessHelmClient
// ============================================================================

TEST(ToolingHelmClient, LintArguments)
{
  const ScopedTempDir dir("chartscan_test");
  ProcessHelmClient helm(write_fake_helm(dir.path()).string());

  const auto out = helm.lint("charts/web", {"a.yaml", "b.yaml"});
  EXPECT_TRUE(out.success);
  EXPECT_EQ(out.exit_code, 0);
  EXPECT_EQ(out.output, "lint --strict charts/web --values a.yaml --values b.yaml\n");
}

TEST(ToolingHelmClient, LintFailureCarriesStderr)
{
  const ScopedTempDir dir("chartscan_test");
  ProcessHelmClient helm(write_fake_helm(dir.path()).string());

  const auto out = helm.lint("charts/bad", {});
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.exit_code, 1);
  const std::vector<std::string> expected{"[ERROR] templates/: parse error"};
  EXPECT_EQ(parse_error_lines(out.output), expected);
}

TEST(ToolingHelmClient, DependencyUpdateAndRenderArguments)
{
  const ScopedTempDir dir("chartscan_test");
  ProcessHelmClient helm(write_fake_helm(dir.path()).string());

  const auto dep = helm.update_dependencies("charts/web", "/tmp/cache");
  EXPECT_EQ(dep.output, "dependency update --repository-cache /tmp/cache charts/web\n");

  const auto rendered = helm.render("web", "charts/web", {"v.yaml"});
  EXPECT_TRUE(rendered.success);
  EXPECT_EQ(rendered.std_out, "template web charts/web --values v.yaml\n");
}

TEST(ToolingHelmClient, MissingExecutableFails)
{
  ProcessHelmClient helm("chartscan-no-such-helm-xyz");
  const auto out = helm.lint("charts/web", {});
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.exit_code, 127);
}
