// chartscan/basic/logger.hpp - Progress and status logging
//
// Log lines go to a single stream (std::cerr for the CLI) and are prefixed
// with "[chartscan]" and a local timestamp. Workers scanning charts in
// parallel share one Logger, so every write is serialized.
//
#pragma once

#include <fmt/core.h>

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace chartscan
{

enum class LogLevel : uint8_t {
  Quiet,    ///< Errors only
  Normal,   ///< Errors, warnings and status lines
  Verbose,  ///< Everything, including per-chart stage transitions
};

class Logger
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param level Minimum level of messages to emit
   * @param use_color Whether to use terminal colors
   */
  explicit Logger(std::ostream & os, LogLevel level = LogLevel::Normal, bool use_color = true);

  Logger(const Logger &) = delete;
  Logger & operator=(const Logger &) = delete;

  [[nodiscard]] LogLevel level() const noexcept { return level_; }
  void set_level(LogLevel level) noexcept { level_ = level; }

  template <typename... Args>
  void info(fmt::format_string<Args...> format, Args &&... args)
  {
    if (level_ >= LogLevel::Normal) {
      write(Tag::Info, fmt::format(format, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void verbose(fmt::format_string<Args...> format, Args &&... args)
  {
    if (level_ >= LogLevel::Verbose) {
      write(Tag::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> format, Args &&... args)
  {
    if (level_ >= LogLevel::Normal) {
      write(Tag::Warning, fmt::format(format, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> format, Args &&... args)
  {
    write(Tag::Error, fmt::format(format, std::forward<Args>(args)...));
  }

private:
  enum class Tag : uint8_t { Debug, Info, Warning, Error };

  void write(Tag tag, std::string_view message);

  std::ostream & os_;
  LogLevel level_;
  bool use_color_;
  std::mutex mutex_;
};

}  // namespace chartscan
