// chartscan/values/values_loader.hpp - Values file loading (values.yaml)
//
// Reads YAML values documents into ValueMappings.
//
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "chartscan/basic/diagnostic.hpp"
#include "chartscan/values/value.hpp"

namespace chartscan
{

/**
 * Result of loading a values document.
 */
struct ValuesLoadResult
{
  /// Loaded values (only valid if success == true)
  ValueMapping values;

  /// Whether loading succeeded
  bool success = false;

  /// LoadError when the file could not be read, ParseError for bad YAML
  ErrorKind error_kind = ErrorKind::LoadError;

  /// Error message if loading failed
  std::string error;

  static ValuesLoadResult ok(ValueMapping values)
  {
    ValuesLoadResult r;
    r.values = std::move(values);
    r.success = true;
    return r;
  }

  static ValuesLoadResult fail(ErrorKind kind, std::string msg)
  {
    ValuesLoadResult r;
    r.error_kind = kind;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load a values file from disk.
 *
 * An empty document (or one containing only `null`) yields an empty mapping.
 * A document whose top level is not a mapping is a ParseError.
 *
 * @param path Path to the YAML file
 * @return ValuesLoadResult with the mapping or the error
 */
[[nodiscard]] ValuesLoadResult load_values_file(const std::filesystem::path & path);

/**
 * Parse YAML text as a values document. Never reports a LoadError.
 *
 * Merge keys (`<<: *anchor`, or `<<` with a sequence of mappings) are
 * expanded; keys written next to them win. A key defined twice in the same
 * mapping is a ParseError.
 */
[[nodiscard]] ValuesLoadResult parse_values(const std::string & text);

}  // namespace chartscan
