/**
 * @file Command_uTest.cpp
 * @brief Unit tests for modelbench::process::runCommand.
 *
 * Notes:
 *  - Tests spawn real processes through /bin/sh.
 *  - Timing assertions use generous bounds for CI variance.
 */

#include "src/process/inc/Command.hpp"

#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>

using modelbench::process::CommandOutcome;
using modelbench::process::CommandResult;
using modelbench::process::runCommand;
using modelbench::process::toString;

namespace {

bool haveShell() { return ::access("/bin/sh", X_OK) == 0; }

/// True if pid no longer names a live (non-zombie) process.
bool processGone(pid_t pid) {
  for (int i = 0; i < 200; ++i) {
    if (::kill(pid, 0) != 0 && errno == ESRCH) {
      return true;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (stat && std::getline(stat, line)) {
      const auto CLOSE = line.rfind(')');
      if (CLOSE != std::string::npos && CLOSE + 2 < line.size() && line[CLOSE + 2] == 'Z') {
        return true;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

} // namespace

class CommandTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (!haveShell()) {
      GTEST_SKIP() << "/bin/sh not available";
    }
  }
};

/* ----------------------------- Outcome Tests ----------------------------- */

/** @test Captures stdout of a successful command. */
TEST_F(CommandTest, CapturesStdout) {
  const CommandResult R = runCommand({"/bin/sh", "-c", "echo hello world"}, 10.0);
  EXPECT_EQ(R.outcome, CommandOutcome::Exited);
  EXPECT_EQ(R.exitCode, 0);
  EXPECT_TRUE(R.ok());
  EXPECT_EQ(R.stdoutText, "hello world\n");
  EXPECT_TRUE(R.failureMessage().empty());
}

/** @test stdout and stderr are captured separately. */
TEST_F(CommandTest, CapturesStderrSeparately) {
  const CommandResult R = runCommand({"/bin/sh", "-c", "echo out; echo err 1>&2"}, 10.0);
  EXPECT_TRUE(R.ok());
  EXPECT_EQ(R.stdoutText, "out\n");
  EXPECT_EQ(R.stderrText, "err\n");
}

/** @test Non-zero exit code is reported with stderr as the failure message. */
TEST_F(CommandTest, NonZeroExit) {
  const CommandResult R = runCommand({"/bin/sh", "-c", "echo 'model not found' 1>&2; exit 3"}, 10.0);
  EXPECT_EQ(R.outcome, CommandOutcome::Exited);
  EXPECT_EQ(R.exitCode, 3);
  EXPECT_FALSE(R.ok());
  EXPECT_EQ(R.failureMessage(), "model not found");
}

/** @test Non-zero exit without stderr falls back to the exit code. */
TEST_F(CommandTest, NonZeroExitWithoutStderr) {
  const CommandResult R = runCommand({"/bin/sh", "-c", "exit 2"}, 10.0);
  EXPECT_EQ(R.failureMessage(), "exit code 2");
}

/** @test Missing binary reports SpawnFailed rather than a generic exit 127. */
TEST_F(CommandTest, MissingBinaryIsSpawnFailed) {
  const CommandResult R = runCommand({"modelbench-definitely-not-installed-xyz"}, 10.0);
  EXPECT_EQ(R.outcome, CommandOutcome::SpawnFailed);
  EXPECT_FALSE(R.ok());
  EXPECT_NE(R.error.find("modelbench-definitely-not-installed-xyz"), std::string::npos);
}

/** @test Empty argv is rejected without forking. */
TEST_F(CommandTest, EmptyArgv) {
  const CommandResult R = runCommand({}, 1.0);
  EXPECT_EQ(R.outcome, CommandOutcome::SpawnFailed);
  EXPECT_FALSE(R.error.empty());
}

/** @test Death by signal is reported as Signaled. */
TEST_F(CommandTest, SignaledChild) {
  const CommandResult R = runCommand({"/bin/sh", "-c", "kill -TERM $$"}, 10.0);
  EXPECT_EQ(R.outcome, CommandOutcome::Signaled);
  EXPECT_EQ(R.termSignal, SIGTERM);
  EXPECT_FALSE(R.failureMessage().empty());
}

/** @test stdin is /dev/null so reading it returns EOF immediately. */
TEST_F(CommandTest, StdinIsDevNull) {
  const CommandResult R = runCommand({"/bin/sh", "-c", "cat; echo done"}, 10.0);
  EXPECT_TRUE(R.ok());
  EXPECT_EQ(R.stdoutText, "done\n");
}

/* ----------------------------- Timeout Tests ----------------------------- */

/** @test Deadline expiry kills the child, discards output, and returns promptly. */
TEST_F(CommandTest, TimeoutKillsChild) {
  const auto T0 = std::chrono::steady_clock::now();
  const CommandResult R = runCommand({"/bin/sh", "-c", "echo partial; sleep 30"}, 0.5);
  const double WALL = std::chrono::duration<double>(std::chrono::steady_clock::now() - T0).count();

  EXPECT_EQ(R.outcome, CommandOutcome::TimedOut);
  EXPECT_TRUE(R.stdoutText.empty());
  EXPECT_FALSE(R.error.empty());
  EXPECT_GE(R.elapsedSec, 0.4);
  EXPECT_LT(WALL, 10.0);
}

/** @test Background helpers of a timed-out command are killed with the group. */
TEST_F(CommandTest, TimeoutLeavesNoOrphans) {
  char dir[] = "/tmp/modelbench_cmd_XXXXXX";
  ASSERT_NE(::mkdtemp(dir), nullptr);
  const std::string PID_FILE = std::string(dir) + "/child.pid";

  const std::string SCRIPT = "sleep 30 & echo $! > " + PID_FILE + "; wait";
  const CommandResult R = runCommand({"/bin/sh", "-c", SCRIPT}, 0.5);
  EXPECT_EQ(R.outcome, CommandOutcome::TimedOut);

  std::ifstream in(PID_FILE);
  pid_t helper = 0;
  ASSERT_TRUE(in >> helper);
  EXPECT_TRUE(processGone(helper)) << "helper pid " << helper << " survived";

  std::remove(PID_FILE.c_str());
  ::rmdir(dir);
}

/** @test Zero timeout means no deadline. */
TEST_F(CommandTest, ZeroTimeoutWaits) {
  const CommandResult R = runCommand({"/bin/sh", "-c", "sleep 0.2; echo late"}, 0.0);
  EXPECT_TRUE(R.ok());
  EXPECT_EQ(R.stdoutText, "late\n");
}

/** @test Timeouts far beyond any real run still wait for the child. */
TEST_F(CommandTest, HugeTimeoutIsClamped) {
  for (const double TIMEOUT : {2.0e10, 1.0e11, 1.0e300}) {
    const CommandResult R = runCommand({"/bin/sh", "-c", "sleep 0.3; echo hi"}, TIMEOUT);
    EXPECT_EQ(R.outcome, CommandOutcome::Exited) << TIMEOUT << ": " << R.error;
    EXPECT_EQ(R.stdoutText, "hi\n") << TIMEOUT;
    EXPECT_GE(R.elapsedSec, 0.25) << TIMEOUT;
  }
}

/** @test Exec-report pipe is close-on-exec: a long-running child is not waited on before capture. */
TEST_F(CommandTest, PipesCloseOnExec) {
  const auto T0 = std::chrono::steady_clock::now();
  const CommandResult R = runCommand({"/bin/sh", "-c", "echo early; sleep 30"}, 0.5);
  const double WALL = std::chrono::duration<double>(std::chrono::steady_clock::now() - T0).count();

  EXPECT_EQ(R.outcome, CommandOutcome::TimedOut);
  EXPECT_LT(WALL, 5.0);
}

/** @test Elapsed time reflects child runtime. */
TEST_F(CommandTest, ElapsedTimeMeasured) {
  const CommandResult R = runCommand({"/bin/sh", "-c", "sleep 0.3"}, 10.0);
  EXPECT_TRUE(R.ok());
  EXPECT_GE(R.elapsedSec, 0.25);
  EXPECT_LT(R.elapsedSec, 10.0);
}

/* ----------------------------- toString Tests ----------------------------- */

/** @test Outcome names are stable. */
TEST(CommandOutcomeTest, ToString) {
  EXPECT_STREQ(toString(CommandOutcome::Exited), "exited");
  EXPECT_STREQ(toString(CommandOutcome::Signaled), "signaled");
  EXPECT_STREQ(toString(CommandOutcome::TimedOut), "timed out");
  EXPECT_STREQ(toString(CommandOutcome::SpawnFailed), "spawn failed");
}
