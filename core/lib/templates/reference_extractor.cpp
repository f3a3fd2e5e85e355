// chartscan/templates/reference_extractor.cpp - Value reference extraction
//
#include "chartscan/templates/reference_extractor.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace chartscan
{

namespace
{

constexpr std::string_view k_open = "{{";
constexpr std::string_view k_close = "}}";
constexpr std::string_view k_values_prefix = ".Values.";

bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

bool is_path_char(char c)
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
         c == '.' || c == '[' || c == ']' || c == '-';
}

struct Placeholder
{
  size_t begin = 0;  // offset of "{{"
  size_t end = 0;    // one past "}}"
  std::string_view path;
};

// Match `{{ .Values.<path> }}` at `pos`, which must point at "{{". The path
// may be empty so that `{{ .Values. }}` is caught and rejected instead of
// silently skipped. Runs in linear time over the line.
bool match_placeholder(std::string_view line, size_t pos, Placeholder & out)
{
  size_t i = pos + k_open.size();
  while (i < line.size() && is_space(line[i])) {
    ++i;
  }
  if (line.compare(i, k_values_prefix.size(), k_values_prefix) != 0) {
    return false;
  }
  i += k_values_prefix.size();

  const size_t path_begin = i;
  while (i < line.size() && is_path_char(line[i])) {
    ++i;
  }
  const size_t path_end = i;

  while (i < line.size() && is_space(line[i])) {
    ++i;
  }
  if (line.compare(i, k_close.size(), k_close) != 0) {
    return false;
  }

  out.begin = pos;
  out.end = i + k_close.size();
  out.path = line.substr(path_begin, path_end - path_begin);
  return true;
}

bool read_file(const fs::path & path, std::string & out, std::string & error)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    error = "open " + path.string() + ": " + std::strerror(errno);
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    error = "read " + path.string() + " failed";
    return false;
  }
  out = ss.str();
  return true;
}

bool has_template_extension(const fs::path & path)
{
  return path.extension() == k_template_extension;
}

void collect_template_files(
  const fs::path & dir, std::vector<fs::path> & files, DiagnosticBag & diags)
{
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    diags.report_error(
      ErrorKind::WalkError, "Error accessing file " + dir.string() + ": " + ec.message());
    return;
  }

  std::vector<fs::directory_entry> entries;
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      diags.report_error(
        ErrorKind::WalkError, "Error accessing file " + dir.string() + ": " + ec.message());
      break;
    }
    entries.push_back(*it);
  }

  // Lexical order keeps diagnostics stable across runs.
  std::sort(entries.begin(), entries.end(), [](const auto & a, const auto & b) {
    return a.path().filename() < b.path().filename();
  });

  for (const auto & entry : entries) {
    // Symlinked directories are not followed.
    const fs::file_status st = entry.symlink_status(ec);
    if (ec) {
      diags.report_error(
        ErrorKind::WalkError,
        "Error accessing file " + entry.path().string() + ": " + ec.message());
      ec.clear();
      continue;
    }
    if (fs::is_directory(st)) {
      collect_template_files(entry.path(), files, diags);
    } else if (has_template_extension(entry.path())) {
      files.push_back(entry.path());
    }
  }
}

}  // namespace

ExtractResult extract_references(std::string_view text, const fs::path & file)
{
  std::vector<ValueReference> refs;

  uint32_t line_number = 0;
  size_t line_start = 0;
  while (line_start <= text.size()) {
    size_t line_end = text.find('\n', line_start);
    if (line_end == std::string_view::npos) {
      line_end = text.size();
    }
    ++line_number;

    const std::string_view line = text.substr(line_start, line_end - line_start);
    size_t pos = line.find(k_open);
    while (pos != std::string_view::npos) {
      Placeholder match;
      if (!match_placeholder(line, pos, match)) {
        pos = line.find(k_open, pos + 1);
        continue;
      }
      if (match.path.empty()) {
        return ExtractResult::fail(
          "empty value reference: " + std::string(line.substr(match.begin, match.end - match.begin)));
      }

      ValueReference ref;
      ref.name = std::string(match.path);
      ref.file = file;
      ref.line = line_number;
      ref.full_text = std::string(line.substr(match.begin, match.end - match.begin));
      refs.push_back(std::move(ref));

      pos = line.find(k_open, match.end);
    }

    if (line_end == text.size()) {
      break;
    }
    line_start = line_end + 1;
  }

  return ExtractResult::ok(std::move(refs));
}

TemplateScanResult scan_templates(const fs::path & chart_dir)
{
  TemplateScanResult result;
  const fs::path templates_dir = chart_dir / "templates";

  std::error_code ec;
  const fs::file_status st = fs::status(templates_dir, ec);
  if (!fs::exists(st)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      result.diagnostics.report_error(
        ErrorKind::WalkError, "Error accessing templates directory: " + ec.message());
    }
    return result;
  }
  if (!fs::is_directory(st)) {
    result.diagnostics.report_error(
      ErrorKind::WalkError,
      "Expected templates to be a directory but found a file: " + templates_dir.string());
    return result;
  }

  std::vector<fs::path> files;
  collect_template_files(templates_dir, files, result.diagnostics);

  for (const auto & file : files) {
    std::string content;
    std::string error;
    if (!read_file(file, content, error)) {
      result.diagnostics.report_error(
        ErrorKind::WalkError, "Error accessing file " + file.string() + ": " + error);
      continue;
    }
    ++result.files_scanned;

    ExtractResult extracted = extract_references(content, file);
    if (!extracted.success) {
      result.diagnostics
        .report_error(
          ErrorKind::ParseError,
          "Error parsing template file " + file.string() + ": " + extracted.error)
        .with_location(file);
      continue;
    }
    result.references.insert(
      result.references.end(), std::make_move_iterator(extracted.references.begin()),
      std::make_move_iterator(extracted.references.end()));
  }

  return result;
}

}  // namespace chartscan
