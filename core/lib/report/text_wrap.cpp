// chartscan/report/text_wrap.cpp - Terminal text measurement and wrapping
//
#include "chartscan/report/text_wrap.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

namespace chartscan
{

namespace
{

// Decode one UTF-8 code point starting at i.
// Returns {codepoint, bytes_consumed}. On invalid input, consumes 1 byte.
std::pair<uint32_t, size_t> decode_utf8(std::string_view s, size_t i)
{
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) {
    return {b0, 1};
  }
  if ((b0 & 0xE0) == 0xC0 && i + 1 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    if ((b1 & 0xC0) == 0x80) {
      return {(static_cast<uint32_t>(b0 & 0x1F) << 6) | static_cast<uint32_t>(b1 & 0x3F), 2};
    }
  }
  if ((b0 & 0xF0) == 0xE0 && i + 2 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    const auto b2 = static_cast<unsigned char>(s[i + 2]);
    if (((b1 & 0xC0) == 0x80) && ((b2 & 0xC0) == 0x80)) {
      const uint32_t cp = (static_cast<uint32_t>(b0 & 0x0F) << 12) |
                          (static_cast<uint32_t>(b1 & 0x3F) << 6) |
                          static_cast<uint32_t>(b2 & 0x3F);
      return {cp, 3};
    }
  }
  if ((b0 & 0xF8) == 0xF0 && i + 3 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    const auto b2 = static_cast<unsigned char>(s[i + 2]);
    const auto b3 = static_cast<unsigned char>(s[i + 3]);
    if (((b1 & 0xC0) == 0x80) && ((b2 & 0xC0) == 0x80) && ((b3 & 0xC0) == 0x80)) {
      const uint32_t cp = (static_cast<uint32_t>(b0 & 0x07) << 18) |
                          (static_cast<uint32_t>(b1 & 0x3F) << 12) |
                          (static_cast<uint32_t>(b2 & 0x3F) << 6) |
                          static_cast<uint32_t>(b3 & 0x3F);
      return {cp, 4};
    }
  }
  return {b0, 1};
}

bool is_combining(uint32_t cp)
{
  return (cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x200B && cp <= 0x200F) ||
         (cp >= 0xFE00 && cp <= 0xFE0F);
}

bool is_wide(uint32_t cp)
{
  return (cp >= 0x1100 && cp <= 0x115F) || (cp >= 0x2E80 && cp <= 0xA4CF) ||
         (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 0xF900 && cp <= 0xFAFF) ||
         (cp >= 0xFE30 && cp <= 0xFE4F) || (cp >= 0xFF00 && cp <= 0xFF60) ||
         (cp >= 0xFFE0 && cp <= 0xFFE6) || (cp >= 0x1F300 && cp <= 0x1F64F) ||
         (cp >= 0x1F900 && cp <= 0x1F9FF) || (cp >= 0x20000 && cp <= 0x3FFFD);
}

}  // namespace

size_t display_width(std::string_view text)
{
  size_t width = 0;
  size_t i = 0;
  while (i < text.size()) {
    const auto [cp, consumed] = decode_utf8(text, i);
    i += consumed;
    if (is_combining(cp)) {
      continue;
    }
    width += is_wide(cp) ? 2 : 1;
  }
  return width;
}

std::vector<std::vector<std::string>> wrap_words(
  const std::vector<std::string> & words, size_t spacing, size_t limit, size_t penalty)
{
  const size_t n = words.size();
  if (n == 0) {
    return {};
  }

  std::vector<size_t> widths(n);
  for (size_t i = 0; i < n; ++i) {
    widths[i] = display_width(words[i]);
  }

  // prefix[k]: total width of words[0..k)
  std::vector<size_t> prefix(n + 1, 0);
  for (size_t i = 0; i < n; ++i) {
    prefix[i + 1] = prefix[i] + widths[i];
  }
  // Width of words[i..j] on one line
  auto length = [&](size_t i, size_t j) { return prefix[j + 1] - prefix[i] + (j - i) * spacing; };

  constexpr size_t k_unreachable = std::numeric_limits<size_t>::max();
  std::vector<size_t> cost(n, k_unreachable);
  std::vector<size_t> next_break(n, n);

  for (size_t idx = n; idx-- > 0;) {
    if (length(idx, n - 1) <= limit) {
      cost[idx] = 0;
      next_break[idx] = n;
      continue;
    }
    for (size_t j = idx + 1; j <= n; ++j) {
      const size_t len = length(idx, j - 1);
      size_t c = 0;
      if (j < n) {
        const size_t diff = len > limit ? len - limit : limit - len;
        c = diff * diff + cost[j];
      }
      if (len > limit) {
        c += penalty;
      }
      if (c < cost[idx]) {
        cost[idx] = c;
        next_break[idx] = j;
      }
    }
  }

  std::vector<std::vector<std::string>> lines;
  size_t i = 0;
  while (i < n) {
    const size_t end = next_break[i];
    lines.emplace_back(words.begin() + static_cast<std::ptrdiff_t>(i),
                       words.begin() + static_cast<std::ptrdiff_t>(end));
    i = end;
  }
  return lines;
}

std::vector<std::string> wrap_text(std::string_view text, size_t limit)
{
  std::vector<std::string> words;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find_first_of(" \n", start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    words.emplace_back(text.substr(start, end - start));
    if (end == text.size()) {
      break;
    }
    start = end + 1;
  }

  for (const auto & w : words) {
    limit = std::max(limit, display_width(w));
  }

  std::vector<std::string> lines;
  for (const auto & line_words : wrap_words(words, 1, limit)) {
    std::string line;
    for (size_t k = 0; k < line_words.size(); ++k) {
      if (k != 0) {
        line += ' ';
      }
      line += line_words[k];
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

}  // namespace chartscan
