/**
 * @file ModelBench.cpp
 * @brief Generate-call timing and metric derivation.
 */

#include "src/bench/inc/ModelBench.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/helpers/inc/Time.hpp"
#include "src/process/inc/Command.hpp"

#include <cmath> // std::isfinite

#include <fmt/core.h>

namespace modelbench {

namespace bench {

namespace {

using modelbench::helpers::strings::countWhitespaceTokens;
using modelbench::helpers::strings::trim;
using modelbench::helpers::time::elapsedSec;
using modelbench::helpers::time::getMonotonicNs;
using modelbench::helpers::time::MS_PER_SEC;
using modelbench::process::CommandOutcome;
using modelbench::process::CommandResult;
using modelbench::process::runCommand;

/// Failed result with zeroed metrics.
BenchmarkResult failure(std::string_view model, BenchStatus status, std::string error) {
  BenchmarkResult result{};
  result.model = std::string(model);
  result.status = status;
  result.error = std::move(error);
  return result;
}

} // namespace

/* ----------------------------- BenchStatus ----------------------------- */

const char* toString(BenchStatus status) noexcept {
  switch (status) {
  case BenchStatus::Success:
    return "success";
  case BenchStatus::Timeout:
    return "timeout";
  case BenchStatus::Error:
    return "error";
  default:
    return "unknown";
  }
}

/* ----------------------------- BenchConfig ----------------------------- */

bool BenchConfig::isValid() const noexcept {
  if (!runtime.isValid()) {
    return false;
  }
  if (trim(prompt).empty()) {
    return false;
  }
  return std::isfinite(timeoutSec) && timeoutSec > 0.0;
}

/* ----------------------------- BenchmarkResult ----------------------------- */

std::string BenchmarkResult::toString() const {
  if (status != BenchStatus::Success) {
    return fmt::format("{}: {} ({})", model, bench::toString(status), error);
  }
  return fmt::format("{}: {} tokens in {:.2f}s, {:.2f} tok/s, ~{:.0f} ms first token", model,
                     tokenCount, totalTimeSec, tokensPerSecond, firstTokenLatencyMs);
}

/* ----------------------------- Metrics ----------------------------- */

double computeTokensPerSecond(std::size_t tokenCount, double totalTimeSec) noexcept {
  if (!std::isfinite(totalTimeSec) || totalTimeSec <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(tokenCount) / totalTimeSec;
}

double estimateFirstTokenMs(double totalTimeSec) noexcept {
  if (!std::isfinite(totalTimeSec) || totalTimeSec <= 0.0) {
    return 0.0;
  }
  return totalTimeSec * FIRST_TOKEN_FRACTION * MS_PER_SEC;
}

/* ----------------------------- API ----------------------------- */

BenchmarkResult benchmarkModel(const BenchConfig& config, std::string_view model) noexcept {
  if (trim(model).empty()) {
    return failure(model, BenchStatus::Error, "empty model identifier");
  }
  if (!config.isValid()) {
    return failure(model, BenchStatus::Error, "invalid benchmark configuration");
  }

  const std::uint64_t START = getMonotonicNs();
  const CommandResult RUN =
      runCommand(runtime::generateArgv(config.runtime, model, config.prompt), config.timeoutSec);
  const std::uint64_t END = getMonotonicNs();

  if (RUN.outcome == CommandOutcome::TimedOut) {
    return failure(model, BenchStatus::Timeout, TIMEOUT_ERROR);
  }
  if (!RUN.ok()) {
    return failure(model, BenchStatus::Error, RUN.failureMessage());
  }

  BenchmarkResult result{};
  result.model = std::string(model);
  result.status = BenchStatus::Success;
  result.totalTimeSec = elapsedSec(START, END);
  result.tokenCount = countWhitespaceTokens(RUN.stdoutText);
  result.tokensPerSecond = computeTokensPerSecond(result.tokenCount, result.totalTimeSec);
  result.firstTokenLatencyMs = estimateFirstTokenMs(result.totalTimeSec);
  return result;
}

std::vector<BenchmarkResult> runSweep(const BenchConfig& config,
                                      const std::vector<std::string>& models,
                                      const SweepObserver& observer,
                                      const SweepStartHook& onStart) {
  std::vector<BenchmarkResult> results;
  results.reserve(models.size());

  for (std::size_t i = 0; i < models.size(); ++i) {
    if (onStart) {
      onStart(i, models.size(), models[i]);
    }
    results.push_back(benchmarkModel(config, models[i]));
    if (observer) {
      observer(i, models.size(), results.back());
    }
  }

  return results;
}

} // namespace bench

} // namespace modelbench
