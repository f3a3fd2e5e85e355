// chartscan/report/text_table.hpp - Bordered text tables for terminal output
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace chartscan
{

enum class CellColor : uint8_t {
  Default,
  Green,
  Red,
};

struct TableCell
{
  /// May contain newlines; each line is rendered on its own table row
  std::string text;
  CellColor color = CellColor::Default;
};

/**
 * Table with an upper-cased, centered header row and a separator line
 * between body rows:
 *
 *   +------+---------+
 *   | NAME | SUCCESS |
 *   +------+---------+
 *   | web  | ✔       |
 *   +------+---------+
 */
class TextTable
{
public:
  explicit TextTable(std::vector<std::string> headers);

  /// Missing trailing cells render empty; extra cells are ignored.
  void add_row(std::vector<TableCell> cells);

  [[nodiscard]] size_t row_count() const noexcept { return rows_.size(); }

  void render(std::ostream & os, bool use_color) const;

private:
  [[nodiscard]] std::vector<size_t> column_widths() const;

  void render_separator(std::ostream & os, const std::vector<size_t> & widths) const;

  void render_row(
    std::ostream & os, const std::vector<TableCell> & cells, const std::vector<size_t> & widths,
    bool centered, bool use_color) const;

  std::vector<std::string> headers_;
  std::vector<std::vector<TableCell>> rows_;
};

}  // namespace chartscan
