/**
 * @file Command.cpp
 * @brief fork/exec command runner with deadline and process-group kill.
 */

#include "src/process/inc/Command.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/helpers/inc/Time.hpp"

#include <fcntl.h>    // open, fcntl, FD_CLOEXEC
#include <poll.h>     // poll
#include <signal.h>   // killpg, SIGKILL
#include <sys/wait.h> // waitpid
#include <time.h>     // nanosleep
#include <unistd.h>   // pipe, fork, execvp, dup2, setpgid, read, write, _exit

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring> // strerror, strsignal

#include <fmt/core.h>

namespace modelbench {

namespace process {

namespace {

using modelbench::helpers::time::elapsedSec;
using modelbench::helpers::time::getMonotonicNs;

/* ----------------------------- Constants ----------------------------- */

/// Poll granularity while the child is alive (also the exit-check period).
constexpr int POLL_SLICE_MS = 50;

constexpr std::size_t PIPE_CHUNK_SIZE = 8192;

constexpr std::uint64_t NS_PER_MS = 1'000'000ULL;

/* ----------------------------- FileDescriptor ----------------------------- */

/// RAII owner for a raw file descriptor.
class FileDescriptor {
public:
  FileDescriptor() noexcept = default;
  explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

  void reset(int fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_{-1};
};

/// Pipe with close-on-exec on both ends.
struct Pipe {
  FileDescriptor readEnd;
  FileDescriptor writeEnd;

  [[nodiscard]] bool open() noexcept {
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0) {
      return false;
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return ::fcntl(fds[0], F_SETFD, FD_CLOEXEC) == 0 && ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) == 0;
  }
};

/* ----------------------------- Child Side ----------------------------- */

/// Runs in the forked child. Only async-signal-safe calls from here on.
[[noreturn]] void execChild(char* const* argv, int stdoutFd, int stderrFd,
                            int errReportFd) noexcept {
  ::setpgid(0, 0);

  const int NULL_FD = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (NULL_FD >= 0) {
    ::dup2(NULL_FD, STDIN_FILENO);
  }
  ::dup2(stdoutFd, STDOUT_FILENO);
  ::dup2(stderrFd, STDERR_FILENO);

  ::execvp(argv[0], argv);

  const int ERR = errno;
  [[maybe_unused]] const ssize_t W = ::write(errReportFd, &ERR, sizeof(ERR));
  ::_exit(EXEC_FAILURE_EXIT_CODE);
}

/* ----------------------------- Parent Helpers ----------------------------- */

pid_t waitNoIntr(pid_t pid, int* status, int options) noexcept {
  pid_t r = -1;
  do {
    r = ::waitpid(pid, status, options);
  } while (r < 0 && errno == EINTR);
  return r;
}

void sleepMs(int ms) noexcept {
  if (ms <= 0) {
    return;
  }
  struct timespec ts{};
  ts.tv_sec = ms / 1000;
  ts.tv_nsec = static_cast<long>(ms % 1000) * 1'000'000L;
  while (::nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

/// Output stream being collected from the child.
struct Capture {
  FileDescriptor* fd;
  std::string* text;
  bool open;
};

/**
 * Wait up to waitMs for pipe activity and read what is available.
 * Returns true if data was read or a stream reached EOF.
 */
bool pumpPipes(std::array<Capture, 2>& streams, int waitMs) noexcept {
  std::array<struct pollfd, 2> pfds{};
  std::array<std::size_t, 2> index{};
  nfds_t count = 0;
  for (std::size_t i = 0; i < streams.size(); ++i) {
    if (streams[i].open) {
      pfds[count].fd = streams[i].fd->get();
      pfds[count].events = POLLIN;
      index[count] = i;
      ++count;
    }
  }
  if (count == 0) {
    return false;
  }

  const int READY = ::poll(pfds.data(), count, waitMs);
  if (READY <= 0) {
    return false;
  }

  bool progressed = false;
  std::array<char, PIPE_CHUNK_SIZE> buf{};
  for (nfds_t k = 0; k < count; ++k) {
    if ((pfds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
      continue;
    }
    Capture& stream = streams[index[k]];
    const ssize_t N = ::read(stream.fd->get(), buf.data(), buf.size());
    if (N > 0) {
      const std::size_t ROOM = MAX_CAPTURE_BYTES - std::min(MAX_CAPTURE_BYTES, stream.text->size());
      stream.text->append(buf.data(), std::min(ROOM, static_cast<std::size_t>(N)));
      progressed = true;
    } else if (N == 0 || errno != EINTR) {
      stream.open = false;
      stream.fd->reset();
      progressed = true;
    }
  }
  return progressed;
}

} // namespace

/* ----------------------------- CommandOutcome ----------------------------- */

const char* toString(CommandOutcome outcome) noexcept {
  switch (outcome) {
  case CommandOutcome::Exited:
    return "exited";
  case CommandOutcome::Signaled:
    return "signaled";
  case CommandOutcome::TimedOut:
    return "timed out";
  case CommandOutcome::SpawnFailed:
    return "spawn failed";
  default:
    return "unknown";
  }
}

/* ----------------------------- CommandResult ----------------------------- */

std::string CommandResult::failureMessage() const {
  if (ok()) {
    return {};
  }
  if (outcome == CommandOutcome::Exited) {
    const std::string_view STDERR = helpers::strings::trim(stderrText);
    if (!STDERR.empty()) {
      return std::string(STDERR);
    }
    return fmt::format("exit code {}", exitCode);
  }
  return error;
}

/* ----------------------------- API ----------------------------- */

CommandResult runCommand(const std::vector<std::string>& argv, double timeoutSec) noexcept {
  CommandResult result{};

  if (argv.empty() || argv[0].empty()) {
    result.error = "empty command";
    return result;
  }

  // Prepare exec arguments before fork; the child must not allocate.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& ARG : argv) {
    cargv.push_back(const_cast<char*>(ARG.c_str()));
  }
  cargv.push_back(nullptr);

  Pipe outPipe;
  Pipe errPipe;
  Pipe execReport;
  if (!outPipe.open() || !errPipe.open() || !execReport.open()) {
    result.error = fmt::format("pipe failed: {}", std::strerror(errno));
    return result;
  }

  const std::uint64_t START_NS = getMonotonicNs();
  const bool HAS_DEADLINE = timeoutSec > 0.0;
  const double BOUNDED_SEC = std::min(timeoutSec, MAX_TIMEOUT_SEC);
  const std::uint64_t DEADLINE_NS =
      HAS_DEADLINE ? START_NS + static_cast<std::uint64_t>(BOUNDED_SEC * 1.0e9) : 0;

  const pid_t PID = ::fork();
  if (PID < 0) {
    result.error = fmt::format("fork failed: {}", std::strerror(errno));
    return result;
  }
  if (PID == 0) {
    execChild(cargv.data(), outPipe.writeEnd.get(), errPipe.writeEnd.get(),
              execReport.writeEnd.get());
  }

  // Also set from the parent so killpg() is valid even if the child has not run yet.
  ::setpgid(PID, PID);

  outPipe.writeEnd.reset();
  errPipe.writeEnd.reset();
  execReport.writeEnd.reset();

  // exec succeeded iff the report pipe closes without data.
  int execErrno = 0;
  ssize_t reportLen = -1;
  do {
    reportLen = ::read(execReport.readEnd.get(), &execErrno, sizeof(execErrno));
  } while (reportLen < 0 && errno == EINTR);
  if (reportLen == static_cast<ssize_t>(sizeof(execErrno))) {
    int status = 0;
    waitNoIntr(PID, &status, 0);
    result.elapsedSec = elapsedSec(START_NS, getMonotonicNs());
    result.error = fmt::format("cannot execute '{}': {}", argv[0], std::strerror(execErrno));
    return result;
  }

  std::array<Capture, 2> streams{Capture{&outPipe.readEnd, &result.stdoutText, true},
                                 Capture{&errPipe.readEnd, &result.stderrText, true}};

  bool reaped = false;
  bool timedOut = false;
  int status = 0;

  for (;;) {
    if (!reaped && waitNoIntr(PID, &status, WNOHANG) == PID) {
      reaped = true;
    }
    const bool ANY_OPEN = streams[0].open || streams[1].open;
    if (reaped && !ANY_OPEN) {
      break;
    }

    const std::uint64_t NOW = getMonotonicNs();
    if (HAS_DEADLINE && NOW >= DEADLINE_NS) {
      timedOut = true;
      break;
    }

    // Once the child is gone only drain what is already buffered.
    int waitMs = reaped ? 0 : POLL_SLICE_MS;
    if (HAS_DEADLINE) {
      const std::uint64_t REMAINING_MS = (DEADLINE_NS - NOW + NS_PER_MS - 1) / NS_PER_MS;
      waitMs = std::min<int>(waitMs, static_cast<int>(std::min<std::uint64_t>(REMAINING_MS, 1000)));
    }

    if (!ANY_OPEN) {
      sleepMs(waitMs);
      continue;
    }

    const bool PROGRESSED = pumpPipes(streams, waitMs);
    if (reaped && !PROGRESSED) {
      // Pipes are held open by leftover members of the child's group.
      ::killpg(PID, SIGKILL);
      break;
    }
  }

  if (timedOut) {
    ::killpg(PID, SIGKILL);
    if (!reaped) {
      waitNoIntr(PID, &status, 0);
    }
    result.outcome = CommandOutcome::TimedOut;
    result.elapsedSec = elapsedSec(START_NS, getMonotonicNs());
    result.stdoutText.clear();
    result.stderrText.clear();
    result.error = fmt::format("timed out after {:.1f}s", timeoutSec);
    return result;
  }

  result.elapsedSec = elapsedSec(START_NS, getMonotonicNs());

  if (WIFEXITED(status)) {
    result.outcome = CommandOutcome::Exited;
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.outcome = CommandOutcome::Signaled;
    result.termSignal = WTERMSIG(status);
    result.error =
        fmt::format("terminated by signal {} ({})", result.termSignal, ::strsignal(result.termSignal));
  } else {
    result.outcome = CommandOutcome::Signaled;
    result.error = fmt::format("unexpected wait status {:#x}", status);
  }

  return result;
}

} // namespace process

} // namespace modelbench
