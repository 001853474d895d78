#ifndef MODELBENCH_HELPERS_ARGS_HPP
#define MODELBENCH_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parser with short aliases, repeatable flags and
 * positional arguments. Cold-path only.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace modelbench {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;    ///< Long flag string, e.g. "--output"
  std::string_view alias{}; ///< Optional short alias, e.g. "-o"
  std::uint8_t nargs{0};    ///< Number of values required after the flag
  bool required{false};     ///< True if flag must be provided
  bool repeatable{false};   ///< True if repeated uses append instead of replace
  std::string_view desc{};  ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/// Tokens that are not flags or flag values, in command-line order.
using Positionals = std::vector<std::string_view>;

namespace detail {

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  bool repeatable;
  std::string_view flag;
};

/// A token that looks like a flag ("-x", "--xyz"); a lone "-" does not.
inline bool looksLikeFlag(std::string_view tok) noexcept {
  return tok.size() > 1 && tok[0] == '-';
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag (or its alias) is matched, the next nargs tokens are consumed
 * literally as its values. Repeatable flags accumulate values across uses;
 * other flags keep the values of their last use. Unknown flags are errors.
 * Everything else is collected as a positional argument.
 *
 * @param args        Argument list (non-owning views; must outlive the call).
 * @param map         Definitions of accepted flags and their requirements.
 * @param pargs       Output map of parsed values.
 * @param positionals Output positional arguments.
 * @param error       Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          Positionals& positionals,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  // Build reverse LUT once: flag/alias -> compact view
  std::unordered_map<std::string_view, detail::ArgDefView> lut;
  lut.reserve(map.size() * 2);
  for (const auto& KV : map) {
    const detail::ArgDefView VIEW{KV.first, KV.second.nargs, KV.second.repeatable,
                                  KV.second.flag};
    lut.emplace(KV.second.flag, VIEW);
    if (!KV.second.alias.empty()) {
      lut.emplace(KV.second.alias, VIEW);
    }
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (detail::looksLikeFlag(TOK)) {
        if (error) {
          error->get() = fmt::format("Unknown argument '{}'", TOK);
        }
        return false;
      }
      positionals.push_back(TOK);
      continue;
    }

    const detail::ArgDefView& D = it->second;

    // Need tokens in [i+1, i+D.need]
    if (i + static_cast<std::size_t>(D.need) >= N) {
      if (error) {
        error->get() =
            fmt::format("Argument out of bounds: expected {} values for flag '{}'", D.need, D.flag);
      }
      return false;
    }

    auto& out = pargs[D.key];
    if (!D.repeatable) {
      out.clear();
    }
    for (std::uint8_t k = 0; k < D.need; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(D.key);
    i += D.need;
  }

  // Validate required flags
  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * @param progName    Program name (typically argv[0]).
 * @param positional  Positional synopsis, e.g. "[MODEL...]" (may be empty).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view positional,
                       std::string_view description, const ArgMap& map) noexcept {
  if (positional.empty()) {
    fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  } else {
    fmt::print("Usage: {} [OPTIONS] {}\n\n", progName, positional);
  }

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  // Collect and sort flags for consistent output
  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  std::vector<std::string> flagStrs;
  flagStrs.reserve(entries.size());
  std::size_t maxFlagWidth = 16;
  for (const ArgDef* def : entries) {
    std::string flagStr;
    if (!def->alias.empty()) {
      flagStr = fmt::format("{}, {}", def->alias, def->flag);
    } else {
      flagStr = fmt::format("    {}", def->flag);
    }
    if (def->nargs == 1) {
      flagStr += " <value>";
    } else if (def->nargs > 1) {
      flagStr += " <value> ...";
    }
    maxFlagWidth = std::max(maxFlagWidth, flagStr.size());
    flagStrs.push_back(std::move(flagStr));
  }
  maxFlagWidth = std::min<std::size_t>(maxFlagWidth, 30);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const ArgDef& DEF = *entries[i];
    fmt::print("  {:<{}}  {}", flagStrs[i], maxFlagWidth, DEF.desc);
    if (DEF.repeatable) {
      fmt::print(" (repeatable)");
    }
    if (DEF.required) {
      fmt::print(" (required)");
    }
    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace modelbench

#endif // MODELBENCH_HELPERS_ARGS_HPP
