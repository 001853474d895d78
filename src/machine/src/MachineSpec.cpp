/**
 * @file MachineSpec.cpp
 * @brief Host probing via uname, procfs, sysctl and vendor GPU tools.
 */

#include "src/machine/inc/MachineSpec.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/process/inc/Command.hpp"

#include <sys/utsname.h> // uname
#include <unistd.h>      // sysconf

#include <cstdlib> // std::strtol, std::strtoull
#include <cstring> // std::strcmp
#include <set>     // std::set
#include <utility> // std::pair
#include <vector>  // std::vector

#include <fmt/core.h>

namespace modelbench {

namespace machine {

namespace {

using modelbench::helpers::format::roundTo;
using modelbench::helpers::strings::findIgnoreCase;
using modelbench::helpers::strings::splitKeyValue;
using modelbench::helpers::strings::splitLines;
using modelbench::helpers::strings::splitWhitespace;
using modelbench::helpers::strings::trim;
using modelbench::process::CommandResult;
using modelbench::process::runCommand;

constexpr double KIB_PER_GIB = 1024.0 * 1024.0;
constexpr double BYTES_PER_GIB = 1024.0 * 1024.0 * 1024.0;

/// Parse a base-10 integer from a view; returns fallback when nothing parses.
long parseLong(std::string_view text, long fallback) noexcept {
  const std::string BUF(trim(text));
  if (BUF.empty()) {
    return fallback;
  }
  char* end = nullptr;
  const long VAL = std::strtol(BUF.c_str(), &end, 10);
  return end == BUF.c_str() ? fallback : VAL;
}

/// Value after the first ':' at or beyond pos.
std::string_view valueAfterColon(std::string_view line, std::size_t pos) noexcept {
  const std::size_t COLON = line.find(':', pos);
  if (COLON == std::string_view::npos) {
    return {};
  }
  return trim(line.substr(COLON + 1));
}

/// Trimmed stdout of a successful command, or "" on any failure.
std::string queryText(const std::vector<std::string>& argv, double timeoutSec) {
  const CommandResult R = runCommand(argv, timeoutSec);
  if (!R.ok()) {
    return {};
  }
  return std::string(trim(R.stdoutText));
}

/// Online CPUs, or 0 when sysconf cannot tell.
int onlineCpuCount() noexcept {
  const long N = ::sysconf(_SC_NPROCESSORS_ONLN);
  return N > 0 ? static_cast<int>(N) : 0;
}

/* ----------------------------- Platform Probes ----------------------------- */

void probeLinux(double timeoutSec, MachineSpec& spec) {
  std::string text;
  if (helpers::files::readFileToString("/proc/cpuinfo", text)) {
    spec.cpuModel = parseCpuModel(text);
    spec.physicalCores = countPhysicalCores(text);
  }

  spec.logicalCores = onlineCpuCount();
  if (spec.physicalCores <= 0) {
    spec.physicalCores = spec.logicalCores;
  }

  if (helpers::files::readFileToString("/proc/meminfo", text)) {
    spec.memoryGb = parseMemTotalGb(text);
  }

  std::string gpu =
      parseGpuNameList(queryText({"nvidia-smi", "--query-gpu=name", "--format=csv,noheader"},
                                 timeoutSec));
  if (gpu.empty()) {
    gpu = parseRocmProductName(queryText({"rocm-smi", "--showproductname"}, timeoutSec));
  }
  if (!gpu.empty()) {
    spec.gpuModel = std::move(gpu);
  }
}

void probeMac(double timeoutSec, MachineSpec& spec) {
  const std::string BRAND = queryText({"sysctl", "-n", "machdep.cpu.brand_string"}, timeoutSec);
  if (!BRAND.empty()) {
    spec.cpuModel = BRAND;
  }

  spec.physicalCores =
      static_cast<int>(parseLong(queryText({"sysctl", "-n", "hw.physicalcpu"}, timeoutSec), 0));
  spec.logicalCores =
      static_cast<int>(parseLong(queryText({"sysctl", "-n", "hw.logicalcpu"}, timeoutSec), 0));

  const std::string MEM = queryText({"sysctl", "-n", "hw.memsize"}, timeoutSec);
  if (!MEM.empty()) {
    char* end = nullptr;
    const unsigned long long BYTES = std::strtoull(MEM.c_str(), &end, 10);
    if (end != MEM.c_str() && BYTES > 0) {
      spec.memoryGb = roundTo(static_cast<double>(BYTES) / BYTES_PER_GIB, 1);
    }
  }

  spec.gpuModel =
      parseDisplayChipset(queryText({"system_profiler", "SPDisplaysDataType"}, timeoutSec));
}

} // namespace

/* ----------------------------- MachineSpec ----------------------------- */

std::string MachineSpec::coresLabel() const {
  const std::string PHYSICAL = physicalCores > 0 ? fmt::format("{}", physicalCores) : UNKNOWN;
  const std::string LOGICAL = logicalCores > 0 ? fmt::format("{}", logicalCores) : UNKNOWN;
  return fmt::format("{} physical / {} logical", PHYSICAL, LOGICAL);
}

std::string MachineSpec::memoryLabel() const {
  if (memoryGb < 0.0) {
    return UNKNOWN;
  }
  return fmt::format("{:.1f} GB", memoryGb);
}

std::string MachineSpec::toString() const {
  return fmt::format("OS: {} {} ({})\n"
                     "Architecture: {}\n"
                     "CPU: {}\n"
                     "Cores: {}\n"
                     "Memory: {}\n"
                     "GPU: {}\n"
                     "Runtime version: {}",
                     osName, osRelease, osVersion, architecture, cpuModel, coresLabel(),
                     memoryLabel(), gpuModel, runtimeVersion);
}

/* ----------------------------- Parsers ----------------------------- */

std::string parseCpuModel(std::string_view cpuinfo) {
  static constexpr std::string_view KEYS[] = {"model name", "Model", "Hardware", "Processor"};

  const std::vector<std::string_view> LINES = splitLines(cpuinfo);
  for (const std::string_view KEY : KEYS) {
    for (const std::string_view LINE : LINES) {
      std::string_view value;
      if (splitKeyValue(LINE, KEY, value) && !value.empty()) {
        return std::string(value);
      }
    }
  }
  return UNKNOWN;
}

int countPhysicalCores(std::string_view cpuinfo) {
  std::set<std::pair<long, long>> cores;
  long physicalId = 0;
  long coreId = -1;

  const auto FLUSH = [&]() {
    if (coreId >= 0) {
      cores.emplace(physicalId, coreId);
    }
    physicalId = 0;
    coreId = -1;
  };

  for (const std::string_view LINE : splitLines(cpuinfo)) {
    if (trim(LINE).empty()) {
      FLUSH();
      continue;
    }
    std::string_view value;
    if (splitKeyValue(LINE, "physical id", value)) {
      physicalId = parseLong(value, 0);
    } else if (splitKeyValue(LINE, "core id", value)) {
      coreId = parseLong(value, -1);
    }
  }
  FLUSH();

  return static_cast<int>(cores.size());
}

double parseMemTotalGb(std::string_view meminfo) noexcept {
  for (const std::string_view LINE : splitLines(meminfo)) {
    std::string_view value;
    if (!splitKeyValue(LINE, "MemTotal", value)) {
      continue;
    }
    const std::vector<std::string_view> TOKENS = splitWhitespace(value);
    if (TOKENS.empty()) {
      return -1.0;
    }
    const long KB = parseLong(TOKENS.front(), -1);
    if (KB < 0) {
      return -1.0;
    }
    return roundTo(static_cast<double>(KB) / KIB_PER_GIB, 1);
  }
  return -1.0;
}

std::string parseRuntimeVersion(std::string_view text) {
  static constexpr std::string_view MARKER = "version is ";

  for (const std::string_view LINE : splitLines(text)) {
    const std::size_t POS = findIgnoreCase(LINE, MARKER);
    if (POS != std::string_view::npos) {
      const std::string_view VALUE = trim(LINE.substr(POS + MARKER.size()));
      if (!VALUE.empty()) {
        return std::string(VALUE);
      }
    }
  }

  for (const std::string_view LINE : splitLines(text)) {
    if (findIgnoreCase(LINE, "version") == std::string_view::npos) {
      continue;
    }
    const std::vector<std::string_view> TOKENS = splitWhitespace(LINE);
    if (!TOKENS.empty()) {
      return std::string(TOKENS.back());
    }
  }
  return UNKNOWN;
}

std::string parseDisplayChipset(std::string_view text) {
  for (const std::string_view LINE : splitLines(text)) {
    const std::size_t POS = LINE.find("Chip");
    if (POS == std::string_view::npos) {
      continue;
    }
    const std::string_view VALUE = valueAfterColon(LINE, POS);
    if (!VALUE.empty()) {
      return std::string(VALUE);
    }
  }
  return UNKNOWN;
}

std::string parseGpuNameList(std::string_view text) {
  std::string joined;
  for (const std::string_view LINE : splitLines(text)) {
    const std::string_view NAME = trim(LINE);
    if (NAME.empty()) {
      continue;
    }
    if (!joined.empty()) {
      joined += ", ";
    }
    joined.append(NAME);
  }
  return joined;
}

std::string parseRocmProductName(std::string_view text) {
  for (const std::string_view LINE : splitLines(text)) {
    const std::size_t POS = findIgnoreCase(LINE, "Card Series");
    if (POS == std::string_view::npos) {
      continue;
    }
    const std::string_view VALUE = valueAfterColon(LINE, POS);
    if (!VALUE.empty()) {
      return std::string(VALUE);
    }
  }
  return {};
}

/* ----------------------------- API ----------------------------- */

MachineSpec getMachineSpec(const runtime::RuntimeConfig& config) noexcept {
  MachineSpec spec{};

  struct utsname uts{};
  const bool HAVE_UNAME = ::uname(&uts) == 0;
  if (HAVE_UNAME) {
    spec.osName = uts.sysname;
    spec.osRelease = uts.release;
    spec.osVersion = uts.version;
    spec.architecture = uts.machine;
  }

  if (HAVE_UNAME && std::strcmp(uts.sysname, "Darwin") == 0) {
    probeMac(config.queryTimeoutSec, spec);
  } else {
    probeLinux(config.queryTimeoutSec, spec);
  }

  const CommandResult VERSION = runCommand(runtime::versionArgv(config), config.queryTimeoutSec);
  if (VERSION.ok()) {
    // Some builds print the client version to stderr next to a connection warning.
    spec.runtimeVersion = parseRuntimeVersion(VERSION.stdoutText + "\n" + VERSION.stderrText);
  }

  return spec;
}

} // namespace machine

} // namespace modelbench
