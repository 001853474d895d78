#ifndef MODELBENCH_REPORT_BENCH_REPORT_HPP
#define MODELBENCH_REPORT_BENCH_REPORT_HPP
/**
 * @file BenchReport.hpp
 * @brief Markdown rendering of a benchmark session.
 * @note Rendering is pure; writeReport() is the only I/O.
 *
 * Report layout:
 *  1. Title and generation timestamp
 *  2. Machine Specifications
 *  3. Runtime GPU Status
 *  4. Summary (total / successful / failed)
 *  5. Benchmark Results (input order)
 *  6. Fastest by First Token Latency (Top 5, ascending)
 *  7. Fastest by Throughput (Top 5, descending)
 *  8. Notes
 */

#include "src/bench/inc/ModelBench.hpp"
#include "src/gpu/inc/GpuUsage.hpp"
#include "src/machine/inc/MachineSpec.hpp"

#include <cstddef> // std::size_t
#include <ctime>   // std::time_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace modelbench {

namespace report {

/* ----------------------------- Constants ----------------------------- */

/// Entries shown in each ranking table.
inline constexpr std::size_t RANKING_LIMIT = 5;

/// Report path used when none is given.
inline constexpr const char* DEFAULT_REPORT_PATH = "ollama_benchmark_report.md";

/* ----------------------------- BenchReport ----------------------------- */

/**
 * @brief Everything the renderer needs, assembled once after the sweep.
 */
struct BenchReport {
  std::vector<bench::BenchmarkResult> results;                ///< One per attempted model, in order
  modelbench::machine::MachineSpec machine{};                 ///< Host snapshot
  modelbench::gpu::GpuStatus gpu{};                           ///< Reconciled final GPU status
  std::string runtimeBinary{runtime::DEFAULT_RUNTIME_BINARY}; ///< Runtime CLI name
  std::time_t generatedAt{0};                                 ///< Wall-clock time of generation
};

/* ----------------------------- ReportSummary ----------------------------- */

/**
 * @brief Outcome counts.
 */
struct ReportSummary {
  std::size_t total{0};
  std::size_t successful{0};
  std::size_t failed{0};
};

/// @brief Count outcomes; failed covers both timeout and error.
[[nodiscard]] ReportSummary summarize(const std::vector<bench::BenchmarkResult>& results) noexcept;

/* ----------------------------- Rankings ----------------------------- */

/**
 * @brief Successful results by ascending first-token latency.
 * @param results All results.
 * @param limit Maximum entries returned.
 * @return Copies, compared at report precision; ties keep input order.
 */
[[nodiscard]] std::vector<bench::BenchmarkResult>
rankByLatency(const std::vector<bench::BenchmarkResult>& results,
              std::size_t limit = RANKING_LIMIT);

/**
 * @brief Successful results by descending throughput.
 * @param results All results.
 * @param limit Maximum entries returned.
 * @return Copies, compared at report precision; ties keep input order.
 */
[[nodiscard]] std::vector<bench::BenchmarkResult>
rankByThroughput(const std::vector<bench::BenchmarkResult>& results,
                 std::size_t limit = RANKING_LIMIT);

/* ----------------------------- Rendering ----------------------------- */

/// @brief Local time as "YYYY-MM-DD HH:MM:SS".
[[nodiscard]] std::string formatTimestamp(std::time_t when);

/**
 * @brief Render the full Markdown document.
 * @note Deterministic for a given report (the timestamp is an input).
 */
[[nodiscard]] std::string renderMarkdownReport(const BenchReport& report);

/* ----------------------------- Output ----------------------------- */

/**
 * @brief Write rendered content to path, replacing any existing file.
 * @param path Destination.
 * @param content Rendered Markdown.
 * @param error Diagnostic on failure.
 * @return true on success.
 */
[[nodiscard]] bool writeReport(const std::string& path, const std::string& content,
                               std::string& error) noexcept;

} // namespace report

} // namespace modelbench

#endif // MODELBENCH_REPORT_BENCH_REPORT_HPP
