#ifndef MODELBENCH_MACHINE_MACHINE_SPEC_HPP
#define MODELBENCH_MACHINE_MACHINE_SPEC_HPP
/**
 * @file MachineSpec.hpp
 * @brief Static host facts recorded alongside benchmark results.
 * @note Linux: uname(2), /proc/cpuinfo, sysconf(_SC_NPROCESSORS_ONLN), /proc/meminfo, nvidia-smi/rocm-smi.
 * @note macOS: uname(2), sysctl, system_profiler.
 * @note Thread-safe: All functions are stateless.
 *
 * Every sub-query degrades to an "Unknown" placeholder; getMachineSpec()
 * never fails.
 */

#include "src/runtime/inc/RuntimeCli.hpp"

#include <string>      // std::string
#include <string_view> // std::string_view

namespace modelbench {

namespace machine {

/* ----------------------------- Constants ----------------------------- */

/// Placeholder for facts that could not be determined.
inline constexpr const char* UNKNOWN = "Unknown";

/* ----------------------------- MachineSpec ----------------------------- */

/**
 * @brief Snapshot of the host, taken once per benchmark session.
 */
struct MachineSpec {
  std::string osName{UNKNOWN};         ///< uname sysname, e.g. "Linux"
  std::string osRelease{UNKNOWN};      ///< uname release, e.g. "6.8.0-45-generic"
  std::string osVersion{UNKNOWN};      ///< uname version
  std::string architecture{UNKNOWN};   ///< uname machine, e.g. "x86_64"
  std::string cpuModel{UNKNOWN};       ///< CPU brand string
  int physicalCores{0};                ///< 0 when unknown
  int logicalCores{0};                 ///< 0 when unknown
  double memoryGb{-1.0};               ///< Total RAM in GiB (1 decimal); < 0 when unknown
  std::string gpuModel{UNKNOWN};       ///< GPU name(s), comma separated
  std::string runtimeVersion{UNKNOWN}; ///< Runtime CLI version

  /// @brief Core counts as "<physical> physical / <logical> logical".
  [[nodiscard]] std::string coresLabel() const;

  /// @brief Memory as "<n> GB" or "Unknown".
  [[nodiscard]] std::string memoryLabel() const;

  /// @brief Human-readable multi-line summary.
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsers ----------------------------- */

/**
 * @brief CPU model from /proc/cpuinfo text.
 *
 * Keys tried in order: "model name" (x86), "Model" (Raspberry Pi), "Hardware"
 * and "Processor" (older ARM kernels).
 *
 * @return Brand string, or "Unknown".
 */
[[nodiscard]] std::string parseCpuModel(std::string_view cpuinfo);

/**
 * @brief Physical core count from /proc/cpuinfo text.
 * @return Distinct (physical id, core id) pairs, or 0 when the kernel does not
 *         report topology (caller falls back to the logical count).
 */
[[nodiscard]] int countPhysicalCores(std::string_view cpuinfo);

/**
 * @brief MemTotal from /proc/meminfo in GiB rounded to one decimal.
 * @return Negative when the key is missing or malformed.
 */
[[nodiscard]] double parseMemTotalGb(std::string_view meminfo) noexcept;

/**
 * @brief Version from `<runtime> --version` output.
 *
 * "ollama version is 0.5.7" -> "0.5.7". Otherwise the last token of the first
 * line mentioning "version".
 *
 * @return Version text, or "Unknown".
 */
[[nodiscard]] std::string parseRuntimeVersion(std::string_view text);

/**
 * @brief GPU name from `system_profiler SPDisplaysDataType` output.
 * @return Value of the first "Chipset Model:" (or "Chip:") line, or "Unknown".
 */
[[nodiscard]] std::string parseDisplayChipset(std::string_view text);

/**
 * @brief GPU names from `nvidia-smi --query-gpu=name --format=csv,noheader`.
 * @return Non-blank lines joined by ", ", or "" when there are none.
 */
[[nodiscard]] std::string parseGpuNameList(std::string_view text);

/**
 * @brief Product name from `rocm-smi --showproductname`.
 * @return Value of the first "Card Series" line (any case), or "".
 */
[[nodiscard]] std::string parseRocmProductName(std::string_view text);

/* ----------------------------- API ----------------------------- */

/**
 * @brief Probe the host.
 * @param config Runtime to query for its version; also bounds tool queries.
 * @return Populated snapshot; unknown facts keep their placeholders.
 */
[[nodiscard]] MachineSpec getMachineSpec(const runtime::RuntimeConfig& config) noexcept;

} // namespace machine

} // namespace modelbench

#endif // MODELBENCH_MACHINE_MACHINE_SPEC_HPP
