// chartscan/tooling/helm_client.hpp - Interface to the helm binary
//
// Dependency resolution, linting and rendering are delegated to helm. The
// chart processor only sees pass/fail plus helm's raw output, so tests can
// substitute a fake client.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace chartscan
{

/// Marker helm puts on lint lines that describe errors.
inline constexpr std::string_view k_error_marker = "[ERROR]";

/// Marker helm puts on lint lines that describe warnings.
inline constexpr std::string_view k_warning_marker = "[WARNING]";

/**
 * Outcome of one helm invocation.
 */
struct ToolOutput
{
  bool success = false;
  int exit_code = -1;

  /// stdout followed by stderr
  std::string output;

  /// stdout alone (the rendered manifest for `helm template`)
  std::string std_out;
};

class HelmClient
{
public:
  HelmClient() = default;
  virtual ~HelmClient() = default;

  HelmClient(const HelmClient &) = delete;
  HelmClient & operator=(const HelmClient &) = delete;

  /// `helm dependency update --repository-cache <cache_dir> <chart>`
  virtual ToolOutput update_dependencies(
    const std::filesystem::path & chart, const std::filesystem::path & cache_dir) = 0;

  /// `helm lint --strict <chart> --values <file>...`
  virtual ToolOutput lint(
    const std::filesystem::path & chart,
    const std::vector<std::filesystem::path> & values_files) = 0;

  /// `helm template <release> <chart> --values <file>...`
  virtual ToolOutput render(
    const std::string & release, const std::filesystem::path & chart,
    const std::vector<std::filesystem::path> & values_files) = 0;
};

/**
 * HelmClient that runs a helm executable as a child process.
 *
 * Stateless: one instance may be shared by all worker threads.
 */
class ProcessHelmClient final : public HelmClient
{
public:
  /// @param executable Program name or path (looked up on PATH)
  explicit ProcessHelmClient(std::string executable = "helm");

  ToolOutput update_dependencies(
    const std::filesystem::path & chart, const std::filesystem::path & cache_dir) override;

  ToolOutput lint(
    const std::filesystem::path & chart,
    const std::vector<std::filesystem::path> & values_files) override;

  ToolOutput render(
    const std::string & release, const std::filesystem::path & chart,
    const std::vector<std::filesystem::path> & values_files) override;

  [[nodiscard]] const std::string & executable() const noexcept { return executable_; }

private:
  [[nodiscard]] ToolOutput run(std::vector<std::string> args) const;

  std::string executable_;
};

/**
 * Lines of `output` that contain `marker`, verbatim and in order.
 */
[[nodiscard]] std::vector<std::string> filter_marked_lines(
  std::string_view output, std::string_view marker);

/// filter_marked_lines(output, "[ERROR]")
[[nodiscard]] std::vector<std::string> parse_error_lines(std::string_view output);

}  // namespace chartscan
