// chartscan/basic/logger.cpp - Logger implementation
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "chartscan/basic/logger.hpp"

#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include <ctime>
#include <ostream>
#include <rang.hpp>

namespace chartscan
{

Logger::Logger(std::ostream & os, LogLevel level, bool use_color)
: os_(os), level_(level), use_color_(use_color)
{
}

void Logger::write(Tag tag, std::string_view message)
{
  const std::string stamp = fmt::format("{:%Y/%m/%d %H:%M:%S}", fmt::localtime(std::time(nullptr)));

  const std::lock_guard<std::mutex> lock(mutex_);
  fmt::print(os_, "[chartscan] {} ", stamp);

  if (use_color_) {
    switch (tag) {
      case Tag::Debug:
        os_ << rang::style::dim << message << rang::style::reset;
        break;
      case Tag::Info:
        os_ << message;
        break;
      case Tag::Warning:
        os_ << rang::fg::yellow << "warning: " << rang::fg::reset << message;
        break;
      case Tag::Error:
        os_ << rang::style::bold << rang::fg::red << "error: " << rang::fg::reset
            << rang::style::reset << message;
        break;
    }
  } else {
    switch (tag) {
      case Tag::Debug:
      case Tag::Info:
        fmt::print(os_, "{}", message);
        break;
      case Tag::Warning:
        fmt::print(os_, "warning: {}", message);
        break;
      case Tag::Error:
        fmt::print(os_, "error: {}", message);
        break;
    }
  }
  os_ << '\n';
  os_.flush();
}

}  // namespace chartscan
