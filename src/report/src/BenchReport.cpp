/**
 * @file BenchReport.cpp
 * @brief Markdown report rendering, rankings and output.
 */

#include "src/report/inc/BenchReport.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Format.hpp"

#include <algorithm> // std::stable_sort
#include <iterator>  // std::back_inserter

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/format.h>

namespace modelbench {

namespace report {

namespace {

using modelbench::bench::BenchmarkResult;
using modelbench::helpers::format::markdownCell;
using modelbench::helpers::format::metric;
using modelbench::helpers::format::roundTo;

/// Decimal places shown for every metric.
constexpr int METRIC_DECIMALS = 2;

/// Successful results only, in input order.
std::vector<BenchmarkResult> successful(const std::vector<BenchmarkResult>& results) {
  std::vector<BenchmarkResult> out;
  std::copy_if(results.begin(), results.end(), std::back_inserter(out),
               [](const BenchmarkResult& r) { return r.succeeded(); });
  return out;
}

void truncate(std::vector<BenchmarkResult>& ranked, std::size_t limit) {
  if (ranked.size() > limit) {
    ranked.resize(limit);
  }
}

/* ----------------------------- Sections ----------------------------- */

void appendMachine(fmt::memory_buffer& out, const BenchReport& report) {
  const machine::MachineSpec& M = report.machine;
  fmt::format_to(std::back_inserter(out),
                 "## Machine Specifications\n\n"
                 "| Spec | Value |\n"
                 "|------|-------|\n"
                 "| **OS** | {} {} |\n"
                 "| **CPU** | {} |\n"
                 "| **CPU Cores** | {} |\n"
                 "| **Memory** | {} |\n"
                 "| **GPU** | {} |\n"
                 "| **Architecture** | {} |\n"
                 "| **Runtime** | {} {} |\n\n",
                 markdownCell(M.osName), markdownCell(M.osRelease), markdownCell(M.cpuModel),
                 markdownCell(M.coresLabel()), markdownCell(M.memoryLabel()),
                 markdownCell(M.gpuModel), markdownCell(M.architecture),
                 markdownCell(report.runtimeBinary), markdownCell(M.runtimeVersion));
}

void appendGpu(fmt::memory_buffer& out, const gpu::GpuStatus& status) {
  fmt::format_to(std::back_inserter(out),
                 "## Runtime GPU Status\n\n"
                 "| Property | Value |\n"
                 "|----------|-------|\n"
                 "| **GPU Available** | {} |\n"
                 "| **GPU Backend** | {} |\n"
                 "| **Runtime Using GPU** | {} |\n"
                 "| **GPU/CPU Split** | {} |\n\n",
                 status.gpuAvailable ? "Yes" : "No", markdownCell(status.backend),
                 status.usageLabel(), markdownCell(status.gpuLayers));
}

void appendSummary(fmt::memory_buffer& out, const ReportSummary& summary) {
  fmt::format_to(std::back_inserter(out),
                 "## Summary\n\n"
                 "- **Total Models Benchmarked:** {}\n"
                 "- **Successful:** {}\n"
                 "- **Failed:** {}\n\n",
                 summary.total, summary.successful, summary.failed);
}

void appendResults(fmt::memory_buffer& out, const std::vector<BenchmarkResult>& results) {
  fmt::format_to(std::back_inserter(out),
                 "## Benchmark Results\n\n"
                 "| Model | Status | First Token (ms) | Tokens/Second | Total Time (s) | "
                 "Token Count |\n"
                 "|-------|--------|------------------|---------------|----------------|"
                 "-------------|\n");

  for (const BenchmarkResult& R : results) {
    if (R.succeeded()) {
      fmt::format_to(std::back_inserter(out), "| {} | {} | {} | {} | {} | {} |\n",
                     markdownCell(R.model), bench::toString(R.status),
                     metric(R.firstTokenLatencyMs), metric(R.tokensPerSecond),
                     metric(R.totalTimeSec), R.tokenCount);
    } else {
      const std::string MESSAGE = R.error.empty() ? std::string("Unknown error") : R.error;
      fmt::format_to(std::back_inserter(out), "| {} | {} | - | - | - | Error: {} |\n",
                     markdownCell(R.model), bench::toString(R.status), markdownCell(MESSAGE));
    }
  }
}

void appendRankings(fmt::memory_buffer& out, const std::vector<BenchmarkResult>& results) {
  fmt::format_to(std::back_inserter(out),
                 "\n## Fastest by First Token Latency (Top {})\n\n"
                 "| Model | First Token (ms) |\n"
                 "|-------|------------------|\n",
                 RANKING_LIMIT);
  for (const BenchmarkResult& R : rankByLatency(results)) {
    fmt::format_to(std::back_inserter(out), "| {} | {} |\n", markdownCell(R.model),
                   metric(R.firstTokenLatencyMs));
  }

  fmt::format_to(std::back_inserter(out),
                 "\n## Fastest by Throughput (Top {})\n\n"
                 "| Model | Tokens/Second |\n"
                 "|-------|---------------|\n",
                 RANKING_LIMIT);
  for (const BenchmarkResult& R : rankByThroughput(results)) {
    fmt::format_to(std::back_inserter(out), "| {} | {} |\n", markdownCell(R.model),
                   metric(R.tokensPerSecond));
  }
}

void appendNotes(fmt::memory_buffer& out) {
  fmt::format_to(std::back_inserter(out),
                 "\n## Notes\n\n"
                 "- **First Token (ms):** Estimated time to first token (milliseconds), taken as "
                 "{:.0f}% of total time; responses are not streamed\n"
                 "- **Tokens/Second:** Throughput in tokens per second\n"
                 "- **Total Time (s):** Total benchmark time in seconds\n"
                 "- **Token Count:** Number of whitespace-delimited words in the response\n",
                 bench::FIRST_TOKEN_FRACTION * 100.0);
}

} // namespace

/* ----------------------------- Summary ----------------------------- */

ReportSummary summarize(const std::vector<bench::BenchmarkResult>& results) noexcept {
  ReportSummary summary{};
  summary.total = results.size();
  for (const BenchmarkResult& R : results) {
    if (R.succeeded()) {
      ++summary.successful;
    }
  }
  summary.failed = summary.total - summary.successful;
  return summary;
}

/* ----------------------------- Rankings ----------------------------- */

std::vector<bench::BenchmarkResult> rankByLatency(const std::vector<bench::BenchmarkResult>& results,
                                                  std::size_t limit) {
  std::vector<BenchmarkResult> ranked = successful(results);
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const BenchmarkResult& a, const BenchmarkResult& b) {
                     return roundTo(a.firstTokenLatencyMs, METRIC_DECIMALS) <
                            roundTo(b.firstTokenLatencyMs, METRIC_DECIMALS);
                   });
  truncate(ranked, limit);
  return ranked;
}

std::vector<bench::BenchmarkResult>
rankByThroughput(const std::vector<bench::BenchmarkResult>& results, std::size_t limit) {
  std::vector<BenchmarkResult> ranked = successful(results);
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const BenchmarkResult& a, const BenchmarkResult& b) {
                     return roundTo(a.tokensPerSecond, METRIC_DECIMALS) >
                            roundTo(b.tokensPerSecond, METRIC_DECIMALS);
                   });
  truncate(ranked, limit);
  return ranked;
}

/* ----------------------------- Rendering ----------------------------- */

std::string formatTimestamp(std::time_t when) {
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(when));
}

std::string renderMarkdownReport(const BenchReport& report) {
  fmt::memory_buffer out;

  fmt::format_to(std::back_inserter(out),
                 "# Model Benchmark Report\n\n"
                 "**Generated:** {}\n\n",
                 formatTimestamp(report.generatedAt));

  appendMachine(out, report);
  appendGpu(out, report.gpu);
  appendSummary(out, summarize(report.results));
  appendResults(out, report.results);
  appendRankings(out, report.results);
  appendNotes(out);

  return fmt::to_string(out);
}

/* ----------------------------- Output ----------------------------- */

bool writeReport(const std::string& path, const std::string& content, std::string& error) noexcept {
  return helpers::files::writeFileAtomic(path, content, error);
}

} // namespace report

} // namespace modelbench
