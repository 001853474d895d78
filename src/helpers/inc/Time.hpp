#ifndef MODELBENCH_HELPERS_TIME_HPP
#define MODELBENCH_HELPERS_TIME_HPP
/**
 * @file Time.hpp
 * @brief Monotonic timestamps and duration conversions.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC

namespace modelbench {
namespace helpers {
namespace time {

/* ----------------------------- Constants ----------------------------- */

inline constexpr double NS_PER_SEC = 1.0e9;
inline constexpr double MS_PER_SEC = 1000.0;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * CLOCK_MONOTONIC is unaffected by wall-clock adjustments, so differences
 * between two readings are valid elapsed times.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/// Convert nanoseconds to seconds.
[[nodiscard]] inline double nsToSec(std::uint64_t ns) noexcept {
  return static_cast<double>(ns) / NS_PER_SEC;
}

/// Elapsed seconds between two monotonic readings (0 if end precedes start).
[[nodiscard]] inline double elapsedSec(std::uint64_t startNs, std::uint64_t endNs) noexcept {
  return endNs > startNs ? nsToSec(endNs - startNs) : 0.0;
}

} // namespace time
} // namespace helpers
} // namespace modelbench

#endif // MODELBENCH_HELPERS_TIME_HPP
