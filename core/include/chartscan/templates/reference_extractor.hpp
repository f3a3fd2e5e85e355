// chartscan/templates/reference_extractor.hpp - Value reference extraction
//
// Finds `{{ .Values.<path> }}` placeholders in chart templates. Only that
// exact shape is recognized; pipelines, function calls, conditionals and
// ranges are not references and are skipped without error.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "chartscan/basic/diagnostic.hpp"

namespace chartscan
{

/**
 * One occurrence of a value placeholder in a template.
 */
struct ValueReference
{
  std::string name;  ///< Dotted path after `.Values.`, never empty
  std::filesystem::path file;
  uint32_t line = 0;      ///< 1-based
  std::string full_text;  ///< The whole matched placeholder

  [[nodiscard]] bool operator==(const ValueReference & other) const
  {
    return name == other.name && file == other.file && line == other.line &&
           full_text == other.full_text;
  }
};

/**
 * Result of extracting references from one template.
 */
struct ExtractResult
{
  std::vector<ValueReference> references;
  bool success = false;
  std::string error;

  static ExtractResult ok(std::vector<ValueReference> refs)
  {
    ExtractResult r;
    r.references = std::move(refs);
    r.success = true;
    return r;
  }

  static ExtractResult fail(std::string msg)
  {
    ExtractResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Extract value references from template text.
 *
 * A placeholder with an empty path (`{{ .Values. }}`) fails the whole text:
 * no partial list is returned.
 *
 * @param text Template contents
 * @param file Path recorded on each reference
 */
[[nodiscard]] ExtractResult extract_references(
  std::string_view text, const std::filesystem::path & file);

/**
 * References and diagnostics collected from a chart's templates directory.
 */
struct TemplateScanResult
{
  std::vector<ValueReference> references;
  DiagnosticBag diagnostics;
  size_t files_scanned = 0;
};

/// Template files are recognized by this extension.
inline constexpr const char * k_template_extension = ".yaml";

/**
 * Extract references from every `*.yaml` file below `<chart_dir>/templates`.
 *
 * A missing templates directory yields an empty result. Files that cannot be
 * accessed produce a WalkError and the walk continues; files that fail to
 * parse produce a ParseError.
 */
[[nodiscard]] TemplateScanResult scan_templates(const std::filesystem::path & chart_dir);

}  // namespace chartscan
