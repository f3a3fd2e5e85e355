// chartscan/driver/chart_templater.cpp - Render charts with `helm template`
//
#include "chartscan/driver/chart_templater.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <ostream>
#include <regex>
#include <system_error>

#include "chartscan/basic/diagnostic.hpp"
#include "chartscan/driver/dependency_guard.hpp"

namespace fs = std::filesystem;

namespace chartscan
{

namespace
{

std::string trim(std::string s)
{
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::string join_messages(const std::vector<std::string> & messages)
{
  std::string out = "[";
  for (size_t i = 0; i < messages.size(); ++i) {
    if (i != 0) {
      out += ' ';
    }
    out += messages[i];
  }
  return out + "]";
}

}  // namespace

bool is_valid_release_name(std::string_view name)
{
  static const std::regex re(k_release_name_pattern);
  return std::regex_match(name.begin(), name.end(), re);
}

std::string release_name_for(const fs::path & chart_path)
{
  fs::path cleaned = chart_path.lexically_normal();
  if (!cleaned.has_filename() && cleaned.has_parent_path() && cleaned != cleaned.root_path()) {
    cleaned = cleaned.parent_path();
  }

  std::string name = cleaned.filename().string();
  if (name == "." || name.empty()) {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
      name = cwd.filename().string();
    }
  }
  return trim(std::move(name));
}

TemplateResult template_chart(
  HelmClient & helm, const fs::path & chart_path, const std::vector<fs::path> & values_files,
  const std::optional<fs::path> & output_file, std::ostream & os)
{
  if (chart_path.empty()) {
    return TemplateResult::fail("chart path is empty");
  }

  const fs::path chart = chart_path.lexically_normal();
  const std::string release = release_name_for(chart);
  if (!is_valid_release_name(release)) {
    return TemplateResult::fail("invalid release name: " + release);
  }

  DependencyArtifactsGuard dependency_artifacts(chart);
  DiagnosticBag diags;
  if (!resolve_dependencies(helm, chart, dependency_artifacts, diags)) {
    return TemplateResult::fail("error building dependencies: " + join_messages(diags.error_messages()));
  }

  const ToolOutput out = helm.render(release, chart, values_files);
  if (!out.success) {
    std::string std_err = out.output;
    if (std_err.compare(0, out.std_out.size(), out.std_out) == 0) {
      std_err.erase(0, out.std_out.size());
    }
    return TemplateResult::fail(
      "error running helm template: exit status " + std::to_string(out.exit_code) +
      "\nstderr: " + std_err);
  }

  if (!output_file) {
    os << out.std_out << '\n';
    return TemplateResult::ok();
  }

  std::ofstream file(*output_file, std::ios::app);
  if (!file.is_open()) {
    return TemplateResult::fail(
      "error opening output file " + output_file->string() + ": " + std::strerror(errno));
  }
  file << out.std_out << '\n';
  file.flush();
  if (!file) {
    return TemplateResult::fail("error writing to output file " + output_file->string());
  }
  return TemplateResult::ok();
}

}  // namespace chartscan
