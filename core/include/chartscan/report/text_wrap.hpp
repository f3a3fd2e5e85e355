// chartscan/report/text_wrap.hpp - Terminal text measurement and wrapping
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chartscan
{

/// Line width used for the details column of the pretty report.
inline constexpr size_t k_wrap_width = 120;

/// Extra cost of a line that is longer than the limit.
inline constexpr size_t k_overlong_line_penalty = 100000;

/**
 * Width of a UTF-8 string in terminal columns.
 *
 * East Asian wide and emoji code points count as 2, combining marks as 0.
 * Invalid bytes count as one column each.
 */
[[nodiscard]] size_t display_width(std::string_view text);

/**
 * Split words into lines with minimal raggedness.
 *
 * The cost of a line is the square of its distance to `limit`; lines longer
 * than `limit` (a single word wider than the limit) also pay `penalty`. The
 * last line is free, so it may be short.
 *
 * @param words Words to place, in order
 * @param spacing Columns between adjacent words
 * @param limit Target line width
 * @param penalty Extra cost per overlong line
 * @return Lines as ranges of words; every word appears exactly once
 */
[[nodiscard]] std::vector<std::vector<std::string>> wrap_words(
  const std::vector<std::string> & words, size_t spacing, size_t limit,
  size_t penalty = k_overlong_line_penalty);

/**
 * Wrap one line of text at spaces. Newlines are treated as spaces. The limit
 * is raised to the widest word if a word does not fit.
 */
[[nodiscard]] std::vector<std::string> wrap_text(std::string_view text, size_t limit);

}  // namespace chartscan
