#ifndef MODELBENCH_GPU_GPU_USAGE_HPP
#define MODELBENCH_GPU_GPU_USAGE_HPP
/**
 * @file GpuUsage.hpp
 * @brief GPU capability and runtime GPU-usage detection.
 * @note Linux and macOS. Queries vendor tools and the runtime's `ps` table.
 * @note Thread-safe: No global state; every call spawns its own queries.
 *
 * Detection is a two-call protocol held by the caller:
 *  1. checkGpuCapability(): does the host have a usable GPU at all?
 *  2. checkGpuUsage():      is the runtime currently running models on it?
 *
 * The process table only lists loaded models, so usage is sampled again after
 * benchmarking and combined with reconcileGpuStatus() (latest in-use reading
 * wins). Nothing is cached between calls.
 */

#include "src/gpu/inc/ProcessTable.hpp"
#include "src/runtime/inc/RuntimeCli.hpp"

#include <string>      // std::string
#include <string_view> // std::string_view

namespace modelbench {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

/// Backend value when no GPU was found.
inline constexpr const char* NO_BACKEND = "None";

/// Backend value when only the runtime's process table proves a GPU exists.
inline constexpr const char* RUNTIME_BACKEND = "Detected via runtime";

/// gpuLayers value when no model is loaded.
inline constexpr const char* NO_LAYERS = "N/A";

/* ----------------------------- GpuStatus ----------------------------- */

/**
 * @brief GPU availability and runtime usage snapshot.
 *
 * Invariant: gpuInUse implies gpuAvailable.
 */
struct GpuStatus {
  bool gpuAvailable{false};         ///< Host has a GPU the runtime could use
  bool gpuInUse{false};             ///< Runtime reports a model running on GPU
  std::string gpuLayers{NO_LAYERS}; ///< Processor split, e.g. "100% GPU"
  std::string backend{NO_BACKEND};  ///< e.g. "NVIDIA: RTX 4090, 24564 MiB"

  /// @brief Report wording: "Yes", "Available but not used", or "No".
  [[nodiscard]] const char* usageLabel() const noexcept;

  /// @brief Human-readable summary.
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- GpuQueryTools ----------------------------- */

/**
 * @brief Vendor tools consulted by the capability check.
 */
struct GpuQueryTools {
  std::string nvidiaSmi{"nvidia-smi"};
  std::string rocmSmi{"rocm-smi"};
  std::string systemProfiler{"system_profiler"};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Phase 1: probe static GPU capability.
 * @param config Runtime configuration (query timeout).
 * @param tools Vendor tool names.
 * @return Status with gpuAvailable/backend set; gpuInUse is always false.
 *
 * Linux: nvidia-smi, then rocm-smi. macOS: arm64 implies Metal; Intel Macs
 * consult system_profiler. Missing tools yield {false, "None"}.
 */
[[nodiscard]] GpuStatus checkGpuCapability(const runtime::RuntimeConfig& config,
                                           const GpuQueryTools& tools = {}) noexcept;

/**
 * @brief Fold a parsed process table into a capability snapshot.
 * @param capability Result of checkGpuCapability().
 * @param table Parsed `ps` output.
 * @return New status; gpuAvailable is raised when the table shows GPU use.
 */
[[nodiscard]] GpuStatus applyProcessTable(const GpuStatus& capability, const ProcessTable& table);

/**
 * @brief Phase 2: query the runtime process table.
 * @param config Runtime configuration.
 * @param capability Result of checkGpuCapability().
 * @return Capability plus usage; if `ps` fails, capability with gpuInUse=false.
 */
[[nodiscard]] GpuStatus checkGpuUsage(const runtime::RuntimeConfig& config,
                                      const GpuStatus& capability) noexcept;

/**
 * @brief Both phases in one call.
 */
[[nodiscard]] GpuStatus detectGpuStatus(const runtime::RuntimeConfig& config,
                                        const GpuQueryTools& tools = {}) noexcept;

/**
 * @brief Latest-wins reconciliation of two sequential readings.
 * @param earlier Reading taken first.
 * @param later Reading taken afterwards.
 * @return later if it reports GPU in use, otherwise earlier.
 */
[[nodiscard]] GpuStatus reconcileGpuStatus(const GpuStatus& earlier, const GpuStatus& later);

/* ----------------------------- Parsing Helpers ----------------------------- */

/**
 * @brief Backend description from `nvidia-smi --query-gpu=name,memory.total`.
 * @return "NVIDIA: <lines joined by "; ">", or "" when output is empty.
 */
[[nodiscard]] std::string nvidiaBackend(std::string_view queryOutput);

} // namespace gpu

} // namespace modelbench

#endif // MODELBENCH_GPU_GPU_USAGE_HPP
