// chartscan/basic/diagnostic.hpp - Diagnostic types for chart scanning
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chartscan
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * Classification of a diagnostic.
 *
 * Only ConfigError short-circuits the processing of a chart; every other kind
 * is accumulated alongside the others.
 */
enum class ErrorKind : uint8_t {
  ConfigError,        // malformed chart path, missing explicit values file
  ExternalToolError,  // helm dependency/lint failure
  ParseError,         // malformed manifest, values file or placeholder
  LoadError,          // unreadable values file
  WalkError,          // inaccessible file in the templates tree
  UndefinedValue,     // reference not present in the merged values
  InternalError,
};

[[nodiscard]] const char * to_string(ErrorKind kind) noexcept;

struct SourceLocation
{
  std::filesystem::path file;
  uint32_t line = 0;  // 1-based, 0 when unknown

  [[nodiscard]] bool has_line() const noexcept { return line != 0; }
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  ErrorKind kind = ErrorKind::InternalError;
  std::string message;  // reported verbatim in ChartResult::errors

  std::optional<SourceLocation> location;
  std::optional<std::string> help_message;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic with a fluent interface and registers it with the bag
 * when the builder is destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_location(std::filesystem::path file, uint32_t line = 0);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(ErrorKind kind, std::string message);
  DiagnosticBuilder report_warning(ErrorKind kind, std::string message);

  // Add
  void add(Diagnostic && diag);

  // Accessors
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;

  /// Messages of all Error diagnostics, in insertion order.
  [[nodiscard]] std::vector<std::string> error_messages() const;

  // Utilities
  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace chartscan
