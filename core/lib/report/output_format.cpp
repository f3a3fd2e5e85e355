// chartscan/report/output_format.cpp - Report output formats
//
#include "chartscan/report/output_format.hpp"

namespace chartscan
{

const char * to_string(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::Pretty:
      return "pretty";
    case OutputFormat::Json:
      return "json";
    case OutputFormat::Yaml:
      return "yaml";
    case OutputFormat::JUnit:
      return "junit";
  }
  return "pretty";
}

std::optional<OutputFormat> parse_output_format(std::string_view name) noexcept
{
  if (name == "pretty") {
    return OutputFormat::Pretty;
  }
  if (name == "json") {
    return OutputFormat::Json;
  }
  if (name == "yaml") {
    return OutputFormat::Yaml;
  }
  if (name == "junit") {
    return OutputFormat::JUnit;
  }
  return std::nullopt;
}

}  // namespace chartscan
