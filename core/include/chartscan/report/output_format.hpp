// chartscan/report/output_format.hpp - Report output formats
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace chartscan
{

enum class OutputFormat : uint8_t {
  Pretty,
  Json,
  Yaml,
  JUnit,
};

[[nodiscard]] const char * to_string(OutputFormat format) noexcept;

/// Parse "pretty", "json", "yaml" or "junit" (case-sensitive).
[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view name) noexcept;

}  // namespace chartscan
