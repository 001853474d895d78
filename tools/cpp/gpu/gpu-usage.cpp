/**
 * @file gpu-usage.cpp
 * @brief One-shot GPU capability and runtime usage check.
 *
 * Prints the detected process-table layout, each parsed row and the final
 * GpuStatus. With --file, parses saved `ps` output instead of querying the
 * runtime, which helps verify parsing against captured tables.
 */

#include "src/gpu/inc/GpuUsage.hpp"
#include "src/gpu/inc/ProcessTable.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/process/inc/Command.hpp"
#include "src/runtime/inc/RuntimeCli.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace gpu = modelbench::gpu;
namespace runtime = modelbench::runtime;
namespace args = modelbench::helpers::args;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_RUNTIME = 1,
  ARG_FILE = 2,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Detect GPU capability and whether the runtime is running models on the GPU.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", "-h", 0, false, false, "Show this help message"};
  map[ARG_RUNTIME] = {"--runtime", {}, 1, false, false, "Runtime CLI binary (default: ollama)"};
  map[ARG_FILE] = {"--file", "-f", 1, false, false, "Parse saved process-table output"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printTable(const gpu::ProcessTable& table) {
  fmt::print("Layout: {}", gpu::toString(table.layout.strategy));
  if (table.layout.strategy == gpu::TableStrategy::HeaderColumns) {
    if (table.layout.processorEnd == std::string_view::npos) {
      fmt::print(" (PROCESSOR at {}, to end of line)", table.layout.processorStart);
    } else {
      fmt::print(" (PROCESSOR at {}, CONTEXT at {})", table.layout.processorStart,
                 table.layout.processorEnd);
    }
  }
  fmt::print("\n");

  if (table.rows.empty()) {
    fmt::print("  (no models loaded)\n");
  }
  for (const gpu::ProcessRow& ROW : table.rows) {
    fmt::print("  {:<24} '{}'{}\n", ROW.name, ROW.processor,
               gpu::indicatesGpu(ROW.processor) ? "  [GPU]" : "");
  }
  if (table.skippedRows > 0) {
    fmt::print("  ({} unparseable row(s) skipped)\n", table.skippedRows);
  }
}

void printStatus(const gpu::GpuStatus& status) {
  fmt::print("\nGPU Available:     {}\n", status.gpuAvailable ? "Yes" : "No");
  fmt::print("GPU Backend:       {}\n", status.backend);
  fmt::print("Runtime Using GPU: {}\n", status.usageLabel());
  fmt::print("GPU/CPU Split:     {}\n", status.gpuLayers);
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  args::Positionals positionals;

  runtime::RuntimeConfig config{};
  std::string inputFile;

  if (argc > 1) {
    std::vector<std::string_view> argList;
    argList.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      argList.emplace_back(argv[i]);
    }

    std::string error;
    if (!args::parseArgs(argList, ARG_MAP, pargs, positionals, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      args::printUsage(argv[0], {}, DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (pargs.count(ARG_HELP) != 0) {
      args::printUsage(argv[0], {}, DESCRIPTION, ARG_MAP);
      return 0;
    }

    if (!positionals.empty()) {
      fmt::print(stderr, "Error: unexpected argument '{}'\n", positionals.front());
      return 1;
    }
    if (pargs.count(ARG_RUNTIME) != 0) {
      config.binary = std::string(pargs[ARG_RUNTIME][0]);
    }
    if (pargs.count(ARG_FILE) != 0) {
      inputFile = std::string(pargs[ARG_FILE][0]);
    }
  }

  const gpu::GpuStatus CAPABILITY = gpu::checkGpuCapability(config);

  std::string text;
  if (!inputFile.empty()) {
    if (!modelbench::helpers::files::readFileToString(inputFile.c_str(), text)) {
      fmt::print(stderr, "Error: cannot read '{}'\n", inputFile);
      return 1;
    }
    fmt::print("=== Process table ({}) ===\n", inputFile);
  } else {
    const modelbench::process::CommandResult PS =
        modelbench::process::runCommand(runtime::processTableArgv(config), config.queryTimeoutSec);
    if (!PS.ok()) {
      fmt::print(stderr, "Warning: '{} ps' failed: {}\n", config.binary, PS.failureMessage());
      printStatus(gpu::checkGpuUsage(config, CAPABILITY));
      return 0;
    }
    text = PS.stdoutText;
    fmt::print("=== Process table ({} ps) ===\n", config.binary);
  }

  const gpu::ProcessTable TABLE = gpu::parseProcessTable(text);
  printTable(TABLE);
  printStatus(gpu::applyProcessTable(CAPABILITY, TABLE));
  return 0;
}
