#ifndef MODELBENCH_HELPERS_STRINGS_HPP
#define MODELBENCH_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for parsing CLI tool output.
 *
 * All functions work on std::string_view and never throw. Views returned by
 * these functions alias the input and must not outlive it.
 *
 * @note Cold-path: Functions returning containers allocate.
 */

#include <cctype>  // std::isspace, std::toupper
#include <cstddef> // std::size_t
#include <string>
#include <string_view>
#include <vector>

namespace modelbench {
namespace helpers {
namespace strings {

/* ----------------------------- Classification ----------------------------- */

/// True for space, tab, newline, carriage return, vertical tab and form feed.
[[nodiscard]] inline bool isSpace(char c) noexcept {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Strip leading and trailing whitespace.
 * @param text Input view.
 * @return Subview without surrounding whitespace (empty if all whitespace).
 */
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && isSpace(text[begin])) {
    ++begin;
  }
  while (end > begin && isSpace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

/* ----------------------------- Searching ----------------------------- */

/**
 * @brief Case-insensitive (ASCII) substring search.
 * @param haystack Text to search.
 * @param needle Text to look for; an empty needle matches at offset 0.
 * @return Offset of the first match, or std::string_view::npos.
 */
[[nodiscard]] inline std::size_t findIgnoreCase(std::string_view haystack,
                                                std::string_view needle) noexcept {
  if (needle.size() > haystack.size()) {
    return std::string_view::npos;
  }
  for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    std::size_t j = 0;
    while (j < needle.size() &&
           std::toupper(static_cast<unsigned char>(haystack[i + j])) ==
               std::toupper(static_cast<unsigned char>(needle[j]))) {
      ++j;
    }
    if (j == needle.size()) {
      return i;
    }
  }
  return std::string_view::npos;
}

/// @brief Case-insensitive (ASCII) substring test; an empty needle always matches.
[[nodiscard]] inline bool containsIgnoreCase(std::string_view haystack,
                                             std::string_view needle) noexcept {
  return findIgnoreCase(haystack, needle) != std::string_view::npos;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split text into lines.
 *
 * Accepts both "\n" and "\r\n" endings. A trailing newline does not produce
 * an extra empty line; interior empty lines are kept.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

/// @brief Split on runs of whitespace, dropping empty tokens.
[[nodiscard]] inline std::vector<std::string_view> splitWhitespace(std::string_view text) {
  std::vector<std::string_view> tokens;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && isSpace(text[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < text.size() && !isSpace(text[i])) {
      ++i;
    }
    if (i > START) {
      tokens.push_back(text.substr(START, i - START));
    }
  }
  return tokens;
}

/**
 * @brief Count whitespace-delimited tokens without allocating.
 * @note Same token boundaries as splitWhitespace().
 */
[[nodiscard]] inline std::size_t countWhitespaceTokens(std::string_view text) noexcept {
  std::size_t count = 0;
  bool inToken = false;
  for (const char C : text) {
    if (isSpace(C)) {
      inToken = false;
    } else if (!inToken) {
      inToken = true;
      ++count;
    }
  }
  return count;
}

/**
 * @brief Value following "key:" on a "key   : value" style line.
 * @param line Line such as "model name\t: Intel(R) Core(TM) i7".
 * @param key Expected key (compared after trimming).
 * @param value Output trimmed value (untouched if the key does not match).
 * @return true if the line carries the key.
 */
[[nodiscard]] inline bool splitKeyValue(std::string_view line, std::string_view key,
                                        std::string_view& value) noexcept {
  const std::size_t COLON = line.find(':');
  if (COLON == std::string_view::npos) {
    return false;
  }
  if (trim(line.substr(0, COLON)) != key) {
    return false;
  }
  value = trim(line.substr(COLON + 1));
  return true;
}

} // namespace strings
} // namespace helpers
} // namespace modelbench

#endif // MODELBENCH_HELPERS_STRINGS_HPP
