/**
 * @file GpuUsage.cpp
 * @brief GPU capability probing and runtime process-table usage detection.
 */

#include "src/gpu/inc/GpuUsage.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/process/inc/Command.hpp"

#include <sys/utsname.h> // uname

#include <cstdint> // std::uint8_t
#include <cstring> // strcmp

#include <fmt/core.h>

namespace modelbench {

namespace gpu {

namespace {

using modelbench::helpers::strings::splitLines;
using modelbench::helpers::strings::trim;
using modelbench::process::CommandResult;
using modelbench::process::runCommand;

/// Host OS family relevant to GPU probing.
enum class HostKind : std::uint8_t { Linux, MacArm, MacIntel, Other };

HostKind detectHost() noexcept {
  struct utsname uts{};
  if (::uname(&uts) != 0) {
    return HostKind::Other;
  }
  if (std::strcmp(uts.sysname, "Darwin") == 0) {
    return std::strcmp(uts.machine, "arm64") == 0 ? HostKind::MacArm : HostKind::MacIntel;
  }
  if (std::strcmp(uts.sysname, "Linux") == 0) {
    return HostKind::Linux;
  }
  return HostKind::Other;
}

/// Linux: NVIDIA first, then AMD ROCm.
void probeLinux(double timeoutSec, const GpuQueryTools& tools, GpuStatus& status) {
  const CommandResult NVIDIA = runCommand(
      {tools.nvidiaSmi, "--query-gpu=name,memory.total", "--format=csv,noheader"}, timeoutSec);
  if (NVIDIA.ok()) {
    std::string backend = nvidiaBackend(NVIDIA.stdoutText);
    if (!backend.empty()) {
      status.gpuAvailable = true;
      status.backend = std::move(backend);
      return;
    }
  }

  const CommandResult ROCM = runCommand({tools.rocmSmi, "--showproductname"}, timeoutSec);
  if (ROCM.ok()) {
    status.gpuAvailable = true;
    status.backend = "AMD ROCm";
  }
}

/// Intel Macs: Metal support listed by system_profiler.
void probeMacIntel(double timeoutSec, const GpuQueryTools& tools, GpuStatus& status) {
  const CommandResult R = runCommand({tools.systemProfiler, "SPDisplaysDataType"}, timeoutSec);
  if (R.ok() && R.stdoutText.find("Metal") != std::string::npos) {
    status.gpuAvailable = true;
    status.backend = "Metal supported";
  }
}

} // namespace

/* ----------------------------- GpuStatus ----------------------------- */

const char* GpuStatus::usageLabel() const noexcept {
  if (gpuInUse) {
    return "Yes";
  }
  if (gpuAvailable) {
    return "Available but not used";
  }
  return "No";
}

std::string GpuStatus::toString() const {
  return fmt::format("GPU available: {}, backend: {}, runtime using GPU: {}, split: {}",
                     gpuAvailable ? "yes" : "no", backend, usageLabel(), gpuLayers);
}

/* ----------------------------- Parsing Helpers ----------------------------- */

std::string nvidiaBackend(std::string_view queryOutput) {
  std::string joined;
  for (const std::string_view LINE : splitLines(queryOutput)) {
    const std::string_view GPU = trim(LINE);
    if (GPU.empty()) {
      continue;
    }
    if (!joined.empty()) {
      joined += "; ";
    }
    joined.append(GPU);
  }
  if (joined.empty()) {
    return {};
  }
  return "NVIDIA: " + joined;
}

/* ----------------------------- API ----------------------------- */

GpuStatus checkGpuCapability(const runtime::RuntimeConfig& config,
                             const GpuQueryTools& tools) noexcept {
  GpuStatus status{};

  switch (detectHost()) {
  case HostKind::Linux:
    probeLinux(config.queryTimeoutSec, tools, status);
    break;
  case HostKind::MacArm:
    status.gpuAvailable = true;
    status.backend = "Apple Silicon (Metal)";
    break;
  case HostKind::MacIntel:
    probeMacIntel(config.queryTimeoutSec, tools, status);
    break;
  case HostKind::Other:
  default:
    break;
  }

  return status;
}

GpuStatus applyProcessTable(const GpuStatus& capability, const ProcessTable& table) {
  GpuStatus status = capability;
  status.gpuInUse = false;

  std::string layers = table.gpuLayers();
  if (!layers.empty()) {
    status.gpuLayers = std::move(layers);
  }

  if (table.anyGpu()) {
    status.gpuInUse = true;
    if (!status.gpuAvailable) {
      status.gpuAvailable = true;
      if (status.backend == NO_BACKEND) {
        status.backend = RUNTIME_BACKEND;
      }
    }
  }

  return status;
}

GpuStatus checkGpuUsage(const runtime::RuntimeConfig& config,
                        const GpuStatus& capability) noexcept {
  const CommandResult PS =
      runCommand(runtime::processTableArgv(config), config.queryTimeoutSec);
  if (!PS.ok()) {
    GpuStatus status = capability;
    status.gpuInUse = false;
    return status;
  }

  return applyProcessTable(capability, parseProcessTable(PS.stdoutText));
}

GpuStatus detectGpuStatus(const runtime::RuntimeConfig& config,
                          const GpuQueryTools& tools) noexcept {
  return checkGpuUsage(config, checkGpuCapability(config, tools));
}

GpuStatus reconcileGpuStatus(const GpuStatus& earlier, const GpuStatus& later) {
  return later.gpuInUse ? later : earlier;
}

} // namespace gpu

} // namespace modelbench
