// chartscan/basic/temp_dir.hpp - Scoped temporary directory
#pragma once

#include <filesystem>
#include <string_view>

namespace chartscan
{

/**
 * A uniquely named directory under the system temp directory, removed with
 * all of its contents when the object goes out of scope.
 *
 * The constructor throws std::filesystem::filesystem_error if the directory
 * cannot be created.
 */
class ScopedTempDir
{
public:
  explicit ScopedTempDir(std::string_view prefix);
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir & operator=(const ScopedTempDir &) = delete;

  ScopedTempDir(ScopedTempDir && other) noexcept;
  ScopedTempDir & operator=(ScopedTempDir && other) noexcept;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

private:
  void remove() noexcept;

  std::filesystem::path path_;
};

}  // namespace chartscan
