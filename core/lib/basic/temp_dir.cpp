// chartscan/basic/temp_dir.cpp - Scoped temporary directory (POSIX mkdtemp)
//
#include "chartscan/basic/temp_dir.hpp"

#include <stdlib.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace chartscan
{

ScopedTempDir::ScopedTempDir(std::string_view prefix)
{
  const fs::path base = fs::temp_directory_path();
  std::string pattern = (base / (std::string(prefix) + "XXXXXX")).string();

  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    throw fs::filesystem_error(
      "mkdtemp", fs::path(pattern), std::error_code(errno, std::generic_category()));
  }
  path_ = fs::path(buf.data());
}

ScopedTempDir::~ScopedTempDir() { remove(); }

ScopedTempDir::ScopedTempDir(ScopedTempDir && other) noexcept : path_(std::move(other.path_))
{
  other.path_.clear();
}

ScopedTempDir & ScopedTempDir::operator=(ScopedTempDir && other) noexcept
{
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void ScopedTempDir::remove() noexcept
{
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove_all(path_, ec);
  path_.clear();
}

}  // namespace chartscan
