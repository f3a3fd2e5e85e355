// chartscan/analysis/reference_resolver.hpp - Presence check of value references
//
// A reference is resolved when its dotted path can be walked through the
// merged values: every intermediate segment must name a mapping, the last
// segment only has to exist (null counts as defined).
//
// Segments are matched as literal keys. Index notation such as `hosts[0]` is
// not interpreted; it only resolves if the mapping has a key spelled exactly
// `hosts[0]`.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "chartscan/templates/reference_extractor.hpp"
#include "chartscan/values/value.hpp"

namespace chartscan
{

/// Split a dotted path into its segments (`a.b.c` -> `a`, `b`, `c`).
[[nodiscard]] std::vector<std::string> split_reference_path(std::string_view name);

/// Walk `segments` through `values`. An empty path never resolves.
[[nodiscard]] bool path_exists(
  const std::vector<std::string> & segments, const ValueMapping & values);

/// Whether `reference` resolves against `values`.
[[nodiscard]] bool resolve_reference(const ValueReference & reference, const ValueMapping & values);

/**
 * Format the diagnostic for an unresolved reference:
 * `Undefined value: '<path>' referenced in <file> at line <N>`
 */
[[nodiscard]] std::string format_undefined_value(const ValueReference & reference);

/**
 * Check every reference and return one diagnostic string per unresolved
 * occurrence, in reference order.
 */
[[nodiscard]] std::vector<std::string> check_references(
  const std::vector<ValueReference> & references, const ValueMapping & values);

}  // namespace chartscan
