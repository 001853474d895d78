#ifndef MODELBENCH_RUNTIME_RUNTIME_CLI_HPP
#define MODELBENCH_RUNTIME_RUNTIME_CLI_HPP
/**
 * @file RuntimeCli.hpp
 * @brief Command-line surface of the model-serving runtime (ollama-compatible).
 *
 * Subcommands used:
 *  - `ls`                 : table of installed models, first column is the name
 *  - `ps`                 : table of currently loaded models (process table)
 *  - `run <model> <text>` : synchronous generation, full response on stdout
 *  - `--version`          : version banner
 */

#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace modelbench {

namespace runtime {

/* ----------------------------- Constants ----------------------------- */

/// Runtime binary used when none is configured.
inline constexpr const char* DEFAULT_RUNTIME_BINARY = "ollama";

/// Deadline for short metadata queries (ls, ps, --version).
inline constexpr double DEFAULT_QUERY_TIMEOUT_SEC = 10.0;

/* ----------------------------- RuntimeConfig ----------------------------- */

/**
 * @brief How to reach the runtime CLI.
 */
struct RuntimeConfig {
  std::string binary{DEFAULT_RUNTIME_BINARY};         ///< Name or path of the CLI
  double queryTimeoutSec{DEFAULT_QUERY_TIMEOUT_SEC}; ///< Deadline for ls/ps/--version

  /// @brief Validate configuration.
  [[nodiscard]] bool isValid() const noexcept;
};

/* ----------------------------- Argument Builders ----------------------------- */

[[nodiscard]] std::vector<std::string> listModelsArgv(const RuntimeConfig& config);
[[nodiscard]] std::vector<std::string> processTableArgv(const RuntimeConfig& config);
[[nodiscard]] std::vector<std::string> versionArgv(const RuntimeConfig& config);

/**
 * @brief argv for one generate call.
 * @note The prompt is passed as a single argument, never through a shell.
 */
[[nodiscard]] std::vector<std::string> generateArgv(const RuntimeConfig& config,
                                                    std::string_view model,
                                                    std::string_view prompt);

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Extract model identifiers from `ls` output.
 * @param text Raw stdout: header line, then one model per line.
 * @return First whitespace token of each non-blank data line, in order.
 */
[[nodiscard]] std::vector<std::string> parseModelList(std::string_view text);

/* ----------------------------- API ----------------------------- */

/**
 * @brief Enumerate models installed in the runtime.
 * @param config Runtime configuration.
 * @param models Output identifiers (cleared first).
 * @param error Diagnostic when the runtime cannot be queried.
 * @return true if the runtime answered; models may still be empty.
 */
[[nodiscard]] bool listModels(const RuntimeConfig& config, std::vector<std::string>& models,
                              std::string& error) noexcept;

} // namespace runtime

} // namespace modelbench

#endif // MODELBENCH_RUNTIME_RUNTIME_CLI_HPP
