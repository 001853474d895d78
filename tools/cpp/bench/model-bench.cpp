/**
 * @file model-bench.cpp
 * @brief Benchmark locally hosted models and write a Markdown report.
 *
 * Sequence: machine probe, GPU pass, model sweep (with one extra GPU pass
 * after the first successful model), final GPU pass, report.
 */

#include "src/bench/inc/ModelBench.hpp"
#include "src/gpu/inc/GpuUsage.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/machine/inc/MachineSpec.hpp"
#include "src/report/inc/BenchReport.hpp"
#include "src/runtime/inc/RuntimeCli.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace bench = modelbench::bench;
namespace gpu = modelbench::gpu;
namespace machine = modelbench::machine;
namespace report = modelbench::report;
namespace runtime = modelbench::runtime;
namespace args = modelbench::helpers::args;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_MODEL = 1,
  ARG_OUTPUT = 2,
  ARG_TIMEOUT = 3,
  ARG_PROMPT = 4,
  ARG_RUNTIME = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Benchmark first-token latency and throughput of locally hosted models.\n"
    "With no models given, every model listed by '<runtime> ls' is benchmarked.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", "-h", 0, false, false, "Show this help message"};
  map[ARG_MODEL] = {"--model", "-m", 1, false, true, "Model to benchmark"};
  map[ARG_OUTPUT] = {"--output", "-o", 1, false, false,
                     "Report path (default: ollama_benchmark_report.md)"};
  map[ARG_TIMEOUT] = {"--timeout", "-t", 1, false, false,
                      "Per-model timeout in seconds (default: 300)"};
  map[ARG_PROMPT] = {"--prompt", {}, 1, false, false, "Prompt sent to each model"};
  map[ARG_RUNTIME] = {"--runtime", {}, 1, false, false, "Runtime CLI binary (default: ollama)"};
  return map;
}

/// Parse a positive, finite number of seconds.
bool parseSeconds(std::string_view text, double& out) {
  const std::string BUF(text);
  char* end = nullptr;
  const double VAL = std::strtod(BUF.c_str(), &end);
  if (end == BUF.c_str() || *end != '\0' || !std::isfinite(VAL) || VAL <= 0.0) {
    return false;
  }
  out = VAL;
  return true;
}

/* ----------------------------- Output Helpers ----------------------------- */

constexpr const char* GREEN = "\033[32m";
constexpr const char* RED = "\033[31m";
constexpr const char* RESET = "\033[0m";

void printGpu(const char* label, const gpu::GpuStatus& status) {
  fmt::print("{}: {}\n", label, status.toString());
}

void printResult(const bench::BenchmarkResult& result) {
  if (result.succeeded()) {
    fmt::print("  [{}PASS{}] {:.2f}s, {:.2f} tok/s, ~{:.0f} ms first token ({} tokens)\n", GREEN,
               RESET, result.totalTimeSec, result.tokensPerSecond, result.firstTokenLatencyMs,
               result.tokenCount);
  } else {
    fmt::print("  [{}FAIL{}] {}: {}\n", RED, RESET, bench::toString(result.status), result.error);
  }
}

void printSummary(const std::vector<bench::BenchmarkResult>& results,
                  const std::string& reportPath) {
  const report::ReportSummary SUMMARY = report::summarize(results);
  fmt::print("\n=== Summary ===\n");
  fmt::print("Models: {}  Successful: {}  Failed: {}\n", SUMMARY.total, SUMMARY.successful,
             SUMMARY.failed);

  const auto FASTEST = report::rankByLatency(results, 1);
  if (!FASTEST.empty()) {
    fmt::print("Fastest first token: {} (~{:.2f} ms)\n", FASTEST.front().model,
               FASTEST.front().firstTokenLatencyMs);
  }
  const auto THROUGHPUT = report::rankByThroughput(results, 1);
  if (!THROUGHPUT.empty()) {
    fmt::print("Highest throughput:  {} ({:.2f} tok/s)\n", THROUGHPUT.front().model,
               THROUGHPUT.front().tokensPerSecond);
  }
  fmt::print("Report saved to: {}\n", reportPath);
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  args::Positionals positionals;

  bench::BenchConfig config{};
  std::string reportPath = report::DEFAULT_REPORT_PATH;
  std::vector<std::string> models;

  if (argc > 1) {
    std::vector<std::string_view> argList;
    argList.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      argList.emplace_back(argv[i]);
    }

    std::string error;
    if (!args::parseArgs(argList, ARG_MAP, pargs, positionals, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      args::printUsage(argv[0], "[MODEL...]", DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (pargs.count(ARG_HELP) != 0) {
      args::printUsage(argv[0], "[MODEL...]", DESCRIPTION, ARG_MAP);
      return 0;
    }

    if (pargs.count(ARG_OUTPUT) != 0) {
      reportPath = std::string(pargs[ARG_OUTPUT][0]);
    }
    if (pargs.count(ARG_TIMEOUT) != 0 && !parseSeconds(pargs[ARG_TIMEOUT][0], config.timeoutSec)) {
      fmt::print(stderr, "Error: invalid timeout '{}'\n", pargs[ARG_TIMEOUT][0]);
      return 1;
    }
    if (pargs.count(ARG_PROMPT) != 0) {
      config.prompt = std::string(pargs[ARG_PROMPT][0]);
    }
    if (pargs.count(ARG_RUNTIME) != 0) {
      config.runtime.binary = std::string(pargs[ARG_RUNTIME][0]);
    }

    for (const std::string_view MODEL : positionals) {
      models.emplace_back(MODEL);
    }
    if (pargs.count(ARG_MODEL) != 0) {
      for (const std::string_view MODEL : pargs[ARG_MODEL]) {
        models.emplace_back(MODEL);
      }
    }
  }

  if (!config.isValid()) {
    fmt::print(stderr, "Error: invalid configuration (empty prompt or runtime)\n");
    return 1;
  }

  fmt::print("=== Model Benchmark ===\n");

  const machine::MachineSpec MACHINE = machine::getMachineSpec(config.runtime);
  fmt::print("{}\n\n", MACHINE.toString());

  const gpu::GpuStatus CAPABILITY = gpu::checkGpuCapability(config.runtime);
  gpu::GpuStatus gpuStatus = gpu::checkGpuUsage(config.runtime, CAPABILITY);
  printGpu("GPU (before)", gpuStatus);

  if (models.empty()) {
    std::string error;
    if (!runtime::listModels(config.runtime, models, error)) {
      fmt::print(stderr, "Error: {}\n", error);
      return 1;
    }
  }
  if (models.empty()) {
    fmt::print(stderr, "No models found. Pull a model with '{} pull <model>' first.\n",
               config.runtime.binary);
    return 0;
  }

  fmt::print("\nBenchmarking {} model(s), timeout {:.0f}s each\n", models.size(),
             config.timeoutSec);
  fmt::print("Prompt: {}\n\n", config.prompt);

  bool sampledLoaded = false;
  const std::vector<bench::BenchmarkResult> RESULTS = bench::runSweep(
      config, models,
      [&](std::size_t, std::size_t, const bench::BenchmarkResult& result) {
        printResult(result);
        // The model stays loaded right after a successful run.
        if (result.succeeded() && !sampledLoaded) {
          sampledLoaded = true;
          const gpu::GpuStatus LOADED = gpu::checkGpuUsage(config.runtime, CAPABILITY);
          if (LOADED.gpuInUse) {
            fmt::print("  -> GPU acceleration: active ({})\n", LOADED.gpuLayers);
          } else if (LOADED.gpuAvailable) {
            fmt::print("  -> GPU acceleration: not used (CPU only)\n");
          }
          gpuStatus = gpu::reconcileGpuStatus(gpuStatus, LOADED);
        }
      },
      [](std::size_t index, std::size_t total, std::string_view model) {
        fmt::print("[{}/{}] Benchmarking {}...\n", index + 1, total, model);
      });

  gpuStatus = gpu::reconcileGpuStatus(gpuStatus, gpu::checkGpuUsage(config.runtime, CAPABILITY));
  fmt::print("\n");
  printGpu("GPU (final)", gpuStatus);

  report::BenchReport rep{};
  rep.results = RESULTS;
  rep.machine = MACHINE;
  rep.gpu = gpuStatus;
  rep.runtimeBinary = config.runtime.binary;
  rep.generatedAt = std::time(nullptr);

  std::string error;
  if (!report::writeReport(reportPath, report::renderMarkdownReport(rep), error)) {
    fmt::print(stderr, "Error: cannot write report: {}\n", error);
    return 1;
  }

  printSummary(RESULTS, reportPath);
  return 0;
}
