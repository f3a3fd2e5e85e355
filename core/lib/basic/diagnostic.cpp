// chartscan/basic/diagnostic.cpp - Diagnostic implementation
#include "chartscan/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace chartscan
{

const char * to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::ConfigError:
      return "ConfigError";
    case ErrorKind::ExternalToolError:
      return "ExternalToolError";
    case ErrorKind::ParseError:
      return "ParseError";
    case ErrorKind::LoadError:
      return "LoadError";
    case ErrorKind::WalkError:
      return "WalkError";
    case ErrorKind::UndefinedValue:
      return "UndefinedValue";
    case ErrorKind::InternalError:
      return "InternalError";
  }
  return "InternalError";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_location(std::filesystem::path file, uint32_t line)
{
  diagnostic_.location = SourceLocation{std::move(file), line};
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

Diagnostic make_diagnostic(Severity severity, ErrorKind kind, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.kind = kind;
  d.message = std::move(message);
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report_error(ErrorKind kind, std::string message)
{
  return {*this, make_diagnostic(Severity::Error, kind, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(ErrorKind kind, std::string message)
{
  return {*this, make_diagnostic(Severity::Warning, kind, std::move(message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

std::vector<std::string> DiagnosticBag::error_messages() const
{
  std::vector<std::string> result;
  for (const auto & d : diagnostics_) {
    if (d.severity == Severity::Error) {
      result.push_back(d.message);
    }
  }
  return result;
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

}  // namespace chartscan
