#ifndef MODELBENCH_BENCH_MODEL_BENCH_HPP
#define MODELBENCH_BENCH_MODEL_BENCH_HPP
/**
 * @file ModelBench.hpp
 * @brief Timed generation runs against the model-serving runtime.
 * @note Linux/POSIX. Each run spawns `<runtime> run <model> <prompt>`.
 * @note Thread-safe: Functions are stateless; runs execute one at a time.
 *
 * Measurement model:
 *  - Wall time of the whole generate call on the monotonic clock.
 *  - Token count is the number of whitespace-delimited words in the response.
 *  - First-token latency is ESTIMATED as a fixed fraction of total time; the
 *    call is not streamed, so the true first-token time is never observed.
 *
 * @warning NOT RT-safe: Blocks on a child process for up to timeoutSec.
 */

#include "src/runtime/inc/RuntimeCli.hpp"

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <functional>  // std::function
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace modelbench {

namespace bench {

/* ----------------------------- Constants ----------------------------- */

/// Prompt sent to every model unless overridden.
inline constexpr const char* DEFAULT_PROMPT =
    "Explain the concept of machine learning in 50 words.";

/// Per-model deadline for the generate call.
inline constexpr double DEFAULT_TIMEOUT_SEC = 300.0;

/// Fraction of total time reported as first-token latency.
inline constexpr double FIRST_TOKEN_FRACTION = 0.15;

/// Error text for runs cut off by the deadline.
inline constexpr const char* TIMEOUT_ERROR = "Timeout exceeded";

/* ----------------------------- BenchStatus ----------------------------- */

/**
 * @brief Outcome of one benchmark run.
 */
enum class BenchStatus : std::uint8_t {
  Success = 0, ///< Generate call exited 0 within the deadline
  Timeout,     ///< Deadline expired; process group killed
  Error,       ///< Spawn failure, non-zero exit, signal, or invalid input
};

/**
 * @brief Convert status to its report spelling.
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(BenchStatus status) noexcept;

/* ----------------------------- BenchConfig ----------------------------- */

/**
 * @brief Configuration for a benchmark sweep.
 */
struct BenchConfig {
  modelbench::runtime::RuntimeConfig runtime{}; ///< Runtime CLI to drive
  std::string prompt{DEFAULT_PROMPT};           ///< Prompt sent to each model
  double timeoutSec{DEFAULT_TIMEOUT_SEC};       ///< Per-model deadline

  /// @brief Validate configuration.
  /// @return true if prompt is non-empty, timeout positive and runtime valid.
  [[nodiscard]] bool isValid() const noexcept;
};

/* ----------------------------- BenchmarkResult ----------------------------- */

/**
 * @brief Metrics for one model.
 *
 * Metrics are meaningful only when status == Success; otherwise they are zero
 * and error carries the reason.
 */
struct BenchmarkResult {
  std::string model;                      ///< Model identifier as benchmarked
  BenchStatus status{BenchStatus::Error}; ///< Run outcome
  double firstTokenLatencyMs{0.0};        ///< Estimated (see FIRST_TOKEN_FRACTION)
  double tokensPerSecond{0.0};            ///< tokenCount / totalTimeSec
  double totalTimeSec{0.0};               ///< Wall time of the generate call
  std::size_t tokenCount{0};              ///< Whitespace-delimited words in the response
  std::string error;                      ///< Failure reason; empty on success

  /// @brief True if status == Success.
  [[nodiscard]] bool succeeded() const noexcept { return status == BenchStatus::Success; }

  /// @brief One-line summary.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Metrics ----------------------------- */

/**
 * @brief Throughput in tokens per second.
 * @return 0 for non-positive or non-finite durations.
 */
[[nodiscard]] double computeTokensPerSecond(std::size_t tokenCount, double totalTimeSec) noexcept;

/**
 * @brief Estimated first-token latency in milliseconds.
 * @return FIRST_TOKEN_FRACTION * totalTimeSec * 1000, or 0 for invalid input.
 */
[[nodiscard]] double estimateFirstTokenMs(double totalTimeSec) noexcept;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Benchmark a single model.
 * @param config Runtime, prompt and deadline.
 * @param model Model identifier; empty yields an Error result without spawning.
 * @return Populated result; never throws.
 */
[[nodiscard]] BenchmarkResult benchmarkModel(const BenchConfig& config,
                                             std::string_view model) noexcept;

/**
 * @brief Callback invoked after each model of a sweep.
 * @param index Zero-based position in the model list.
 * @param total Number of models in the sweep.
 * @param result Result just produced.
 */
using SweepObserver =
    std::function<void(std::size_t index, std::size_t total, const BenchmarkResult& result)>;

/**
 * @brief Callback invoked before each model of a sweep is started.
 */
using SweepStartHook =
    std::function<void(std::size_t index, std::size_t total, std::string_view model)>;

/**
 * @brief Benchmark models sequentially.
 * @param config Runtime, prompt and deadline.
 * @param models Identifiers in benchmark order.
 * @param observer Optional callback after each result (may be empty).
 * @param onStart Optional callback before each run (may be empty).
 * @return One result per model, in input order.
 *
 * A failing model never stops the sweep. No retries.
 */
[[nodiscard]] std::vector<BenchmarkResult> runSweep(const BenchConfig& config,
                                                    const std::vector<std::string>& models,
                                                    const SweepObserver& observer = {},
                                                    const SweepStartHook& onStart = {});

} // namespace bench

} // namespace modelbench

#endif // MODELBENCH_BENCH_MODEL_BENCH_HPP
