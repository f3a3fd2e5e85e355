// chartscan/tooling/process.hpp - Child process execution
//
// Runs an external program to completion and captures what it printed.
// Safe to call from several threads at once.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chartscan
{

/// Exit code reported when the program could not be started.
inline constexpr int k_exit_not_found = 127;

struct ProcessResult
{
  /// Whether the child process was started
  bool launched = false;

  /// Exit status; 128 + signal number if the child was killed by a signal
  int exit_code = -1;

  std::string std_out;
  std::string std_err;

  /// Set when launching failed
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return launched && exit_code == 0; }

  /// stdout followed by stderr
  [[nodiscard]] std::string combined_output() const { return std_out + std_err; }
};

/**
 * Run `argv[0]` (looked up on PATH) with the given arguments and wait for it
 * to exit. Stdin is connected to /dev/null.
 *
 * @param argv Program and arguments; must not be empty
 * @param working_dir Directory to run in (current directory if unset)
 */
[[nodiscard]] ProcessResult run_process(
  const std::vector<std::string> & argv,
  const std::optional<std::filesystem::path> & working_dir = std::nullopt);

}  // namespace chartscan
