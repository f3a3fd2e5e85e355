// chartscan/tooling/helm_client.cpp - helm subprocess client
//
#include "chartscan/tooling/helm_client.hpp"

#include <utility>

#include "chartscan/tooling/process.hpp"

namespace chartscan
{

namespace
{

void append_values_args(
  std::vector<std::string> & args, const std::vector<std::filesystem::path> & values_files)
{
  for (const auto & f : values_files) {
    args.emplace_back("--values");
    args.push_back(f.string());
  }
}

}  // namespace

ProcessHelmClient::ProcessHelmClient(std::string executable) : executable_(std::move(executable))
{
}

ToolOutput ProcessHelmClient::update_dependencies(
  const std::filesystem::path & chart, const std::filesystem::path & cache_dir)
{
  return run({"dependency", "update", "--repository-cache", cache_dir.string(), chart.string()});
}

ToolOutput ProcessHelmClient::lint(
  const std::filesystem::path & chart, const std::vector<std::filesystem::path> & values_files)
{
  std::vector<std::string> args{"lint", "--strict", chart.string()};
  append_values_args(args, values_files);
  return run(std::move(args));
}

ToolOutput ProcessHelmClient::render(
  const std::string & release, const std::filesystem::path & chart,
  const std::vector<std::filesystem::path> & values_files)
{
  std::vector<std::string> args{"template", release, chart.string()};
  append_values_args(args, values_files);
  return run(std::move(args));
}

ToolOutput ProcessHelmClient::run(std::vector<std::string> args) const
{
  args.insert(args.begin(), executable_);
  const ProcessResult proc = run_process(args);

  ToolOutput out;
  out.success = proc.ok();
  out.exit_code = proc.exit_code;
  out.output = proc.combined_output();
  out.std_out = proc.std_out;
  if (!proc.launched) {
    out.output += proc.error;
  }
  return out;
}

std::vector<std::string> filter_marked_lines(std::string_view output, std::string_view marker)
{
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= output.size()) {
    size_t end = output.find('\n', start);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    const std::string_view line = output.substr(start, end - start);
    if (line.find(marker) != std::string_view::npos) {
      lines.emplace_back(line);
    }
    if (end == output.size()) {
      break;
    }
    start = end + 1;
  }
  return lines;
}

std::vector<std::string> parse_error_lines(std::string_view output)
{
  return filter_marked_lines(output, k_error_marker);
}

}  // namespace chartscan
