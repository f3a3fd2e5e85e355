// chartscan/driver/chart_templater.hpp - Render charts with `helm template`
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chartscan/tooling/helm_client.hpp"

namespace chartscan
{

/// Helm's release name rule (lower-case DNS labels separated by dots).
inline constexpr const char * k_release_name_pattern =
  R"(^[a-z0-9]([-a-z0-9]*[a-z0-9])?(\.[a-z0-9]([-a-z0-9]*[a-z0-9])?)*$)";

[[nodiscard]] bool is_valid_release_name(std::string_view name);

/**
 * Release name for a chart: the last component of the cleaned chart path,
 * or the working directory's name for ".".
 */
[[nodiscard]] std::string release_name_for(const std::filesystem::path & chart_path);

struct TemplateResult
{
  bool success = false;
  std::string error;

  static TemplateResult ok()
  {
    TemplateResult r;
    r.success = true;
    return r;
  }

  static TemplateResult fail(std::string msg)
  {
    TemplateResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Render one chart and write the manifest followed by a newline to `os`,
 * or append it to `output_file` when given.
 *
 * Dependencies are updated first when Chart.yaml declares any, and the
 * artifacts of that update are removed afterwards.
 */
[[nodiscard]] TemplateResult template_chart(
  HelmClient & helm, const std::filesystem::path & chart_path,
  const std::vector<std::filesystem::path> & values_files,
  const std::optional<std::filesystem::path> & output_file, std::ostream & os);

}  // namespace chartscan
