/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file normalizer.hpp
 * @brief Turns raw channel output into clean lines, plus the small string
 *        predicates the module parsers are built from.
 *
 * Clean output: every sentinel occurrence removed, each line trimmed, empty
 * lines dropped, lines joined with a single '\n'. CleanOutput is idempotent.
 */

#ifndef TETHER_NORMALIZER_HPP_
#define TETHER_NORMALIZER_HPP_

#include <cstddef>
#include <string>
#include <vector>

namespace tether {

constexpr const char* kDefaultSentinel = "shell> ";

inline std::string Trim(const std::string& s) {
  static const char* const kWs = " \t\r\n\f\v";
  const size_t first = s.find_first_not_of(kWs);
  if (first == std::string::npos) return std::string();
  const size_t last = s.find_last_not_of(kWs);
  return s.substr(first, last - first + 1);
}

inline void EraseAll(std::string& s, const std::string& needle) {
  if (needle.empty()) return;
  // Rescan from the start: an erase can splice a new occurrence together.
  size_t pos = 0;
  while ((pos = s.find(needle)) != std::string::npos) {
    s.erase(pos, needle.size());
  }
}

/** @brief Clean lines of @p raw, in order. */
inline std::vector<std::string> CleanLines(
    const std::string& raw, const std::string& sentinel = kDefaultSentinel) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= raw.size()) {
    size_t end = raw.find('\n', start);
    if (end == std::string::npos) end = raw.size();
    std::string line = raw.substr(start, end - start);
    EraseAll(line, sentinel);
    line = Trim(line);
    if (!line.empty()) {
      out.push_back(std::move(line));
    }
    start = end + 1;
  }
  return out;
}

inline std::string JoinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i != 0) out.push_back('\n');
    out += lines[i];
  }
  return out;
}

inline std::string CleanOutput(const std::string& raw,
                               const std::string& sentinel = kDefaultSentinel) {
  return JoinLines(CleanLines(raw, sentinel));
}

/** @return First clean line, or empty when there is none. */
inline std::string FirstLine(const std::string& raw,
                             const std::string& sentinel = kDefaultSentinel) {
  std::vector<std::string> lines = CleanLines(raw, sentinel);
  return lines.empty() ? std::string() : lines.front();
}

inline bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

inline bool ContainsIgnoreCase(const std::string& text,
                               const std::string& needle) {
  if (needle.empty()) return true;
  if (needle.size() > text.size()) return false;
  auto lower = [](char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  };
  for (size_t i = 0; i + needle.size() <= text.size(); ++i) {
    size_t j = 0;
    while (j < needle.size() && lower(text[i + j]) == lower(needle[j])) ++j;
    if (j == needle.size()) return true;
  }
  return false;
}

/** @brief Non-overlapping occurrences of @p needle in @p text. */
inline size_t CountOccurrences(const std::string& text,
                               const std::string& needle) {
  if (needle.empty()) return 0;
  size_t count = 0;
  size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    ++count;
    pos += needle.size();
  }
  return count;
}

}  // namespace tether

#endif  // TETHER_NORMALIZER_HPP_
