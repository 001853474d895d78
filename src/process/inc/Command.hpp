#ifndef MODELBENCH_PROCESS_COMMAND_HPP
#define MODELBENCH_PROCESS_COMMAND_HPP
/**
 * @file Command.hpp
 * @brief Synchronous external command execution with a deadline.
 * @note POSIX (Linux, macOS). Uses fork/execvp, poll and process groups.
 * @note Not thread-safe with respect to other fork() callers sharing pipes;
 *       modelbench runs one command at a time.
 *
 * Each command runs in its own process group. If the deadline expires the
 * whole group is killed with SIGKILL and reaped, so a runtime CLI that spawns
 * helpers cannot leave orphans behind.
 */

#include <cstddef> // std::size_t
#include <cstdint> // std::uint8_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace modelbench {

namespace process {

/* ----------------------------- Constants ----------------------------- */

/// Maximum bytes captured per stream; the remainder is drained and dropped.
inline constexpr std::size_t MAX_CAPTURE_BYTES = 16 * 1024 * 1024;

/// Deadlines are clamped here (about 31 years) so the nanosecond deadline fits in 64 bits.
inline constexpr double MAX_TIMEOUT_SEC = 1.0e9;

/// Exit status used by the child when exec fails.
inline constexpr int EXEC_FAILURE_EXIT_CODE = 127;

/* ----------------------------- CommandOutcome ----------------------------- */

/**
 * @brief How a command ended.
 */
enum class CommandOutcome : std::uint8_t {
  Exited = 0,  ///< Process exited normally (see exitCode)
  Signaled,    ///< Process was terminated by a signal it did not expect
  TimedOut,    ///< Deadline expired; process group was killed
  SpawnFailed, ///< Could not create pipes, fork, or exec the binary
};

/**
 * @brief Convert outcome to string.
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(CommandOutcome outcome) noexcept;

/* ----------------------------- CommandResult ----------------------------- */

/**
 * @brief Result of one runCommand() invocation.
 */
struct CommandResult {
  CommandOutcome outcome{CommandOutcome::SpawnFailed};
  int exitCode{-1};       ///< Exit code when outcome == Exited
  int termSignal{0};      ///< Signal number when outcome == Signaled
  std::string stdoutText; ///< Captured stdout (empty on TimedOut)
  std::string stderrText; ///< Captured stderr (empty on TimedOut)
  std::string error;      ///< Diagnostic for SpawnFailed/TimedOut/Signaled
  double elapsedSec{0.0}; ///< Wall time from spawn to reap (monotonic)

  /// @brief True if the process exited with status 0.
  [[nodiscard]] bool ok() const noexcept {
    return outcome == CommandOutcome::Exited && exitCode == 0;
  }

  /// @brief Best one-line description of a failure (empty when ok()).
  [[nodiscard]] std::string failureMessage() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run a command and wait for it, bounded by a deadline.
 * @param argv Program and arguments; argv[0] is resolved through PATH.
 * @param timeoutSec Deadline in seconds; <= 0 waits indefinitely. Values above
 *                   MAX_TIMEOUT_SEC are clamped.
 * @return Populated result; never throws.
 *
 * stdin is /dev/null. stdout and stderr are captured in full (up to
 * MAX_CAPTURE_BYTES each). On deadline expiry the process group is killed,
 * reaped, and any partial output is discarded.
 */
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       double timeoutSec) noexcept;

} // namespace process

} // namespace modelbench

#endif // MODELBENCH_PROCESS_COMMAND_HPP
