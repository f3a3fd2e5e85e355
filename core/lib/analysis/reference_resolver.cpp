// chartscan/analysis/reference_resolver.cpp - Presence check implementation
//
#include "chartscan/analysis/reference_resolver.hpp"

#include <fmt/format.h>

namespace chartscan
{

std::vector<std::string> split_reference_path(std::string_view name)
{
  std::vector<std::string> segments;
  size_t start = 0;
  while (true) {
    const size_t dot = name.find('.', start);
    if (dot == std::string_view::npos) {
      segments.emplace_back(name.substr(start));
      break;
    }
    segments.emplace_back(name.substr(start, dot - start));
    start = dot + 1;
  }
  return segments;
}

bool path_exists(const std::vector<std::string> & segments, const ValueMapping & values)
{
  if (segments.empty()) {
    return false;
  }
  const auto root = values.find(segments.front());
  if (root == values.end()) {
    return false;
  }

  // Value::find yields nullptr for anything that is not a mapping.
  const Value * current = &root->second;
  for (size_t i = 1; i < segments.size() && current != nullptr; ++i) {
    current = current->find(segments[i]);
  }
  return current != nullptr;
}

bool resolve_reference(const ValueReference & reference, const ValueMapping & values)
{
  if (reference.name.empty()) {
    return false;
  }
  return path_exists(split_reference_path(reference.name), values);
}

std::string format_undefined_value(const ValueReference & reference)
{
  return fmt::format(
    "Undefined value: '{}' referenced in {} at line {}", reference.name, reference.file.string(),
    reference.line);
}

std::vector<std::string> check_references(
  const std::vector<ValueReference> & references, const ValueMapping & values)
{
  std::vector<std::string> undefined;
  for (const auto & ref : references) {
    if (!resolve_reference(ref, values)) {
      undefined.push_back(format_undefined_value(ref));
    }
  }
  return undefined;
}

}  // namespace chartscan
