// chartscan/report/text_table.cpp - Bordered text tables for terminal output
//
// Uses rang for cell colors.
//
#include "chartscan/report/text_table.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <rang.hpp>
#include <utility>

#include "chartscan/report/text_wrap.hpp"

namespace chartscan
{

namespace
{

std::vector<std::string> split_lines(const std::string & text)
{
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    const size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string to_upper_ascii(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

}  // namespace

TextTable::TextTable(std::vector<std::string> headers)
{
  headers_.reserve(headers.size());
  for (auto & h : headers) {
    headers_.push_back(to_upper_ascii(std::move(h)));
  }
}

void TextTable::add_row(std::vector<TableCell> cells)
{
  cells.resize(headers_.size());
  rows_.push_back(std::move(cells));
}

std::vector<size_t> TextTable::column_widths() const
{
  std::vector<size_t> widths(headers_.size(), 0);
  for (size_t c = 0; c < headers_.size(); ++c) {
    widths[c] = display_width(headers_[c]);
  }
  for (const auto & row : rows_) {
    for (size_t c = 0; c < row.size(); ++c) {
      for (const auto & line : split_lines(row[c].text)) {
        widths[c] = std::max(widths[c], display_width(line));
      }
    }
  }
  return widths;
}

void TextTable::render_separator(std::ostream & os, const std::vector<size_t> & widths) const
{
  os << '+';
  for (const size_t w : widths) {
    os << std::string(w + 2, '-') << '+';
  }
  os << '\n';
}

void TextTable::render_row(
  std::ostream & os, const std::vector<TableCell> & cells, const std::vector<size_t> & widths,
  bool centered, bool use_color) const
{
  std::vector<std::vector<std::string>> cell_lines;
  size_t height = 1;
  for (const auto & cell : cells) {
    cell_lines.push_back(split_lines(cell.text));
    height = std::max(height, cell_lines.back().size());
  }

  for (size_t l = 0; l < height; ++l) {
    os << '|';
    for (size_t c = 0; c < cells.size(); ++c) {
      const std::string text = l < cell_lines[c].size() ? cell_lines[c][l] : std::string();
      const size_t pad = widths[c] - display_width(text);
      const size_t left = centered ? pad / 2 : 0;
      const size_t right = pad - left;

      os << ' ' << std::string(left, ' ');
      if (use_color && cells[c].color != CellColor::Default && !text.empty()) {
        os << (cells[c].color == CellColor::Green ? rang::fg::green : rang::fg::red) << text
           << rang::fg::reset;
      } else {
        os << text;
      }
      os << std::string(right, ' ') << " |";
    }
    os << '\n';
  }
}

void TextTable::render(std::ostream & os, bool use_color) const
{
  const std::vector<size_t> widths = column_widths();

  std::vector<TableCell> header_cells;
  header_cells.reserve(headers_.size());
  for (const auto & h : headers_) {
    header_cells.push_back(TableCell{h, CellColor::Default});
  }

  render_separator(os, widths);
  render_row(os, header_cells, widths, true, use_color);
  render_separator(os, widths);
  for (const auto & row : rows_) {
    render_row(os, row, widths, false, use_color);
    render_separator(os, widths);
  }
}

}  // namespace chartscan
