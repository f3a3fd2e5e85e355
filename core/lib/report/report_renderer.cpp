// chartscan/report/report_renderer.cpp - Scan report output
//
// Uses fmt for text, nlohmann::json for JSON, yaml-cpp for YAML and
// tinyxml2 for JUnit XML.
//
#include "chartscan/report/report_renderer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <tinyxml2.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string_view>

#include "chartscan/chart/chart_manifest.hpp"
#include "chartscan/project/scan_config.hpp"
#include "chartscan/report/text_table.hpp"
#include "chartscan/report/text_wrap.hpp"

namespace chartscan
{

namespace
{

constexpr const char * k_bullet = "• ";

// ----------------------------------------------------------------------------
// Scalars
// ----------------------------------------------------------------------------

bool parse_bool_text(const std::string & text)
{
  return !text.empty() && (text[0] == 't' || text[0] == 'T');
}

nlohmann::ordered_json float_to_json(const std::string & text)
{
  std::string lower;
  for (const char c : text) {
    lower += static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  }
  if (lower == ".nan") {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (lower == ".inf" || lower == "+.inf") {
    return std::numeric_limits<double>::infinity();
  }
  if (lower == "-.inf") {
    return -std::numeric_limits<double>::infinity();
  }
  char * end = nullptr;
  const double d = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return text;
  }
  return d;
}

nlohmann::ordered_json integer_to_json(const std::string & text)
{
  std::string digits = text;
  bool negative = false;
  if (!digits.empty() && (digits[0] == '+' || digits[0] == '-')) {
    negative = digits[0] == '-';
    digits.erase(0, 1);
  }

  int base = 10;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    base = 16;
    digits.erase(0, 2);
  } else if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'o' || digits[1] == 'O')) {
    base = 8;
    digits.erase(0, 2);
  }

  errno = 0;
  char * end = nullptr;
  const unsigned long long magnitude = std::strtoull(digits.c_str(), &end, base);
  if (end == digits.c_str() || *end != '\0' || errno == ERANGE) {
    return float_to_json(text);
  }
  if (!negative) {
    return static_cast<uint64_t>(magnitude);
  }
  const auto limit = static_cast<unsigned long long>(std::numeric_limits<int64_t>::max()) + 1ULL;
  if (magnitude > limit) {
    return float_to_json(text);
  }
  if (magnitude == limit) {
    return std::numeric_limits<int64_t>::min();
  }
  return -static_cast<int64_t>(magnitude);
}

nlohmann::ordered_json value_to_json(const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Null:
      return nullptr;
    case ValueKind::Scalar:
      switch (v.scalar_kind()) {
        case ScalarKind::Bool:
          return parse_bool_text(v.scalar_text());
        case ScalarKind::Integer:
          return integer_to_json(v.scalar_text());
        case ScalarKind::Float:
          return float_to_json(v.scalar_text());
        case ScalarKind::String:
          return v.scalar_text();
      }
      return v.scalar_text();
    case ValueKind::Sequence: {
      nlohmann::ordered_json arr = nlohmann::ordered_json::array();
      for (const auto & item : v.as_sequence()) {
        arr.push_back(value_to_json(item));
      }
      return arr;
    }
    case ValueKind::Mapping:
      return values_to_json(v.as_mapping());
  }
  return nullptr;
}

/// A String scalar that would read back as another type (or null) in YAML.
bool needs_quoting(const Value & v)
{
  const std::string & text = v.scalar_text();
  return is_null_spelling(text) || classify_plain_scalar(text) != ScalarKind::String;
}

void emit_value(YAML::Emitter & out, const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Null:
      out << YAML::Null;
      return;
    case ValueKind::Scalar:
      if (v.scalar_kind() == ScalarKind::String && needs_quoting(v)) {
        out << YAML::DoubleQuoted << v.scalar_text();
      } else {
        out << v.scalar_text();
      }
      return;
    case ValueKind::Sequence:
      out << YAML::BeginSeq;
      for (const auto & item : v.as_sequence()) {
        emit_value(out, item);
      }
      out << YAML::EndSeq;
      return;
    case ValueKind::Mapping:
      out << YAML::BeginMap;
      for (const auto & [key, child] : v.as_mapping()) {
        out << YAML::Key << key << YAML::Value;
        emit_value(out, child);
      }
      out << YAML::EndMap;
      return;
  }
}

void emit_string_list(YAML::Emitter & out, const char * key, const std::vector<std::string> & items)
{
  out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
  for (const auto & item : items) {
    out << item;
  }
  out << YAML::EndSeq;
}

/// "[a b c]"
std::string bracket_list(const std::vector<std::string> & items)
{
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i != 0) {
      out += ' ';
    }
    out += items[i];
  }
  out += ']';
  return out;
}

std::string bullet_list(const std::vector<std::string> & items)
{
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i != 0) {
      out += '\n';
    }
    out += k_bullet;
    out += items[i];
  }
  return out;
}

void replace_all(std::string & s, std::string_view from, std::string_view to)
{
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

/// "1.500" -> "1.5", "2.000" -> "2"
std::string fixed_trimmed(uint64_t whole, uint64_t frac, int digits)
{
  std::string out = std::to_string(whole);
  if (frac == 0) {
    return out;
  }
  std::string f = fmt::format("{:0{}}", frac, digits);
  while (!f.empty() && f.back() == '0') {
    f.pop_back();
  }
  return out + "." + f;
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

std::string format_duration(std::chrono::nanoseconds duration)
{
  const int64_t count = duration.count();
  if (count == 0) {
    return "0s";
  }
  const bool negative = count < 0;
  const uint64_t ns = negative ? static_cast<uint64_t>(-(count + 1)) + 1 : static_cast<uint64_t>(count);

  std::string out;
  if (ns < 1000ULL) {
    out = std::to_string(ns) + "ns";
  } else if (ns < 1000000ULL) {
    out = fixed_trimmed(ns / 1000ULL, ns % 1000ULL, 3) + "µs";
  } else if (ns < 1000000000ULL) {
    out = fixed_trimmed(ns / 1000000ULL, ns % 1000000ULL, 6) + "ms";
  } else {
    const uint64_t total_seconds = ns / 1000000000ULL;
    const uint64_t hours = total_seconds / 3600;
    const uint64_t minutes = (total_seconds % 3600) / 60;
    const uint64_t seconds = total_seconds % 60;
    if (hours > 0) {
      out += std::to_string(hours) + "h";
    }
    if (hours > 0 || minutes > 0) {
      out += std::to_string(minutes) + "m";
    }
    out += fixed_trimmed(seconds, ns % 1000000000ULL, 9) + "s";
  }
  return negative ? "-" + out : out;
}

std::string format_error_details(const std::vector<std::string> & errors, size_t width)
{
  std::vector<std::string> entries;
  entries.reserve(errors.size());
  for (const auto & err : errors) {
    std::string expanded = err;
    replace_all(expanded, "\\n", "\n");

    std::string entry;
    size_t start = 0;
    bool first_line = true;
    while (start <= expanded.size()) {
      size_t end = expanded.find('\n', start);
      if (end == std::string::npos) {
        end = expanded.size();
      }
      const std::vector<std::string> wrapped =
        wrap_text(std::string_view(expanded).substr(start, end - start), width);

      if (!first_line) {
        entry += '\n';
      }
      first_line = false;
      for (size_t i = 0; i < wrapped.size(); ++i) {
        if (i != 0) {
          entry += "\n  ";
        }
        entry += wrapped[i];
      }

      if (end == expanded.size()) {
        break;
      }
      start = end + 1;
    }
    entries.push_back(std::move(entry));
  }
  return bullet_list(entries);
}

nlohmann::ordered_json values_to_json(const ValueMapping & values)
{
  nlohmann::ordered_json obj = nlohmann::ordered_json::object();
  for (const auto & [key, child] : values) {
    obj[key] = value_to_json(child);
  }
  return obj;
}

// ============================================================================
// Renderers
// ============================================================================

void render_pretty(std::ostream & os, const ScanReport & report, bool use_color)
{
  TextTable table({"Chart Name", "Success", "Details"});

  int valid = 0;
  int invalid = 0;
  for (const auto & result : report.results) {
    const std::string name = read_chart_name(result.path).value_or(result.path);

    TableCell status;
    if (result.success) {
      status = TableCell{"✔", CellColor::Green};
      ++valid;
    } else {
      status = TableCell{"✘", CellColor::Red};
      ++invalid;
    }

    table.add_row(
      {TableCell{name, CellColor::Default}, std::move(status),
       TableCell{format_error_details(result.errors, k_wrap_width), CellColor::Default}});
  }

  table.render(os, use_color);
  fmt::print(
    os, "\nSummary: {} valid charts, {} invalid charts scanned in {}\n", valid, invalid,
    format_duration(report.duration));
}

void render_json(std::ostream & os, const std::vector<ChartResult> & results)
{
  nlohmann::ordered_json arr = nlohmann::ordered_json::array();
  for (const auto & r : results) {
    nlohmann::ordered_json obj;
    obj["ChartPath"] = r.path;
    obj["Success"] = r.success;
    if (!r.errors.empty()) {
      obj["Errors"] = r.errors;
    }
    if (!r.undefined_values.empty()) {
      obj["UndefinedValues"] = r.undefined_values;
    }
    if (!r.values.empty()) {
      obj["Values"] = values_to_json(r.values);
    }
    arr.push_back(std::move(obj));
  }
  os << arr.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << '\n';
}

void render_yaml(std::ostream & os, const std::vector<ChartResult> & results)
{
  YAML::Emitter out;
  out << YAML::BeginSeq;
  for (const auto & r : results) {
    out << YAML::BeginMap;
    out << YAML::Key << "ChartPath" << YAML::Value << r.path;
    out << YAML::Key << "Success" << YAML::Value << r.success;
    if (!r.errors.empty()) {
      emit_string_list(out, "Errors", r.errors);
    }
    if (!r.undefined_values.empty()) {
      emit_string_list(out, "UndefinedValues", r.undefined_values);
    }
    if (!r.values.empty()) {
      out << YAML::Key << "Values" << YAML::Value << YAML::BeginMap;
      for (const auto & [key, child] : r.values) {
        out << YAML::Key << key << YAML::Value;
        emit_value(out, child);
      }
      out << YAML::EndMap;
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  if (!out.good()) {
    throw std::runtime_error("failed to emit YAML: " + out.GetLastError());
  }
  os << out.c_str() << '\n';
}

void render_junit(std::ostream & os, const ScanReport & report)
{
  tinyxml2::XMLDocument doc;

  int failures = 0;
  for (const auto & r : report.results) {
    if (!r.success) {
      ++failures;
    }
  }

  auto * suite = doc.NewElement("testsuite");
  suite->SetAttribute("name", k_junit_suite_name);
  suite->SetAttribute("tests", static_cast<int>(report.results.size()));
  suite->SetAttribute("failures", failures);
  const double seconds = std::chrono::duration<double>(report.duration).count();
  suite->SetAttribute("time", fmt::format("{:.3f}", seconds).c_str());
  doc.InsertEndChild(suite);

  for (const auto & r : report.results) {
    auto * tc = doc.NewElement("testcase");
    tc->SetAttribute("name", r.path.c_str());
    tc->SetAttribute("classname", k_junit_class_name);
    tc->SetAttribute("time", "0");

    if (!r.success) {
      auto * failure = doc.NewElement("failure");
      failure->SetAttribute("message", k_junit_failure_message);
      failure->SetAttribute("type", k_junit_failure_type);
      const std::string content = "Errors: " + bracket_list(r.errors) +
                                  "\nUndefined Values: " + bracket_list(r.undefined_values);
      failure->SetText(content.c_str());
      tc->InsertEndChild(failure);
    } else {
      auto * sysout = doc.NewElement("system-out");
      const std::string content = "Chart " + r.path + " rendered successfully";
      sysout->SetText(content.c_str());
      tc->InsertEndChild(sysout);
    }
    suite->InsertEndChild(tc);
  }

  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  os << printer.CStr();
}

void render_report(std::ostream & os, const ScanReport & report, OutputFormat format, bool use_color)
{
  switch (format) {
    case OutputFormat::Pretty:
      render_pretty(os, report, use_color);
      return;
    case OutputFormat::Json:
      render_json(os, report.results);
      return;
    case OutputFormat::Yaml:
      render_yaml(os, report.results);
      return;
    case OutputFormat::JUnit:
      render_junit(os, report);
      return;
  }
}

void render_environments(std::ostream & os, const ScanConfig & config, bool use_color)
{
  if (config.environments.empty()) {
    os << "No environments configured.\n";
    return;
  }

  TextTable table({"Environment", "Values Files"});
  for (const auto & [name, env] : config.environments) {
    std::vector<std::string> files;
    files.reserve(env.values_files.size());
    for (const auto & f : env.values_files) {
      files.push_back(f.string());
    }
    table.add_row({TableCell{name, CellColor::Default}, TableCell{bullet_list(files), CellColor::Default}});
  }
  table.render(os, use_color);
}

}  // namespace chartscan
