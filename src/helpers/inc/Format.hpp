#ifndef MODELBENCH_HELPERS_FORMAT_HPP
#define MODELBENCH_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Number and Markdown formatting utilities for reports and CLI output.
 *
 * @note NOT RT-SAFE: All functions returning std::string allocate.
 */

#include <cmath>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

namespace modelbench {
namespace helpers {
namespace format {

/* ----------------------------- Rounding ----------------------------- */

/**
 * @brief Round to a fixed number of decimal places.
 * @note Non-finite input yields 0.
 */
[[nodiscard]] inline double roundTo(double value, int decimals) noexcept {
  if (!std::isfinite(value)) {
    return 0.0;
  }
  const double SCALE = std::pow(10.0, decimals);
  return std::round(value * SCALE) / SCALE;
}

/* ----------------------------- Numbers ----------------------------- */

/**
 * @brief Format a metric rounded to two decimals in shortest form.
 * @return e.g. "32.15", "13.9", "5.0".
 */
[[nodiscard]] inline std::string metric(double value) {
  std::string out = fmt::format("{}", roundTo(value, 2));
  if (out.find_first_of(".eE") == std::string::npos) {
    out += ".0";
  }
  return out;
}

/* ----------------------------- Markdown ----------------------------- */

/**
 * @brief Make text safe for a single Markdown table cell.
 *
 * Escapes '|' and folds line breaks into spaces. Empty text becomes "-".
 */
[[nodiscard]] inline std::string markdownCell(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (const char C : text) {
    if (C == '|') {
      out += "\\|";
    } else if (C == '\n' || C == '\r') {
      if (!out.empty() && out.back() != ' ') {
        out.push_back(' ');
      }
    } else {
      out.push_back(C);
    }
  }
  while (!out.empty() && out.back() == ' ') {
    out.pop_back();
  }
  if (out.empty()) {
    return "-";
  }
  return out;
}

} // namespace format
} // namespace helpers
} // namespace modelbench

#endif // MODELBENCH_HELPERS_FORMAT_HPP
