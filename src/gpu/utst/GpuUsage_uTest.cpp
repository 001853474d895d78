/**
 * @file GpuUsage_uTest.cpp
 * @brief Unit tests for modelbench::gpu capability/usage detection and reconciliation.
 *
 * Notes:
 *  - Runtime and vendor tools are impersonated by FakeRuntime scripts.
 *  - Capability probing through nvidia-smi/rocm-smi is only exercised on Linux.
 */

#include "src/gpu/inc/GpuUsage.hpp"
#include "src/runtime/utst/FakeRuntime.hpp"

#include <gtest/gtest.h>

#include <sys/utsname.h>

#include <cstring>
#include <string>

using modelbench::gpu::applyProcessTable;
using modelbench::gpu::checkGpuCapability;
using modelbench::gpu::checkGpuUsage;
using modelbench::gpu::detectGpuStatus;
using modelbench::gpu::GpuQueryTools;
using modelbench::gpu::GpuStatus;
using modelbench::gpu::nvidiaBackend;
using modelbench::gpu::parseProcessTable;
using modelbench::gpu::reconcileGpuStatus;
using modelbench::testing::FakeRuntime;

namespace {

constexpr const char* PS_GPU =
    "NAME            ID              SIZE      PROCESSOR    CONTEXT    UNTIL\n"
    "mistral:7b      6577803aa9a0    5.1 GB    100% GPU     4096       24 hours from now";

constexpr const char* PS_EMPTY =
    "NAME            ID              SIZE      PROCESSOR    CONTEXT    UNTIL";

bool isLinux() {
  struct utsname uts{};
  return ::uname(&uts) == 0 && std::strcmp(uts.sysname, "Linux") == 0;
}

GpuQueryTools missingTools() {
  GpuQueryTools tools{};
  tools.nvidiaSmi = "/nonexistent/modelbench/nvidia-smi";
  tools.rocmSmi = "/nonexistent/modelbench/rocm-smi";
  tools.systemProfiler = "/nonexistent/modelbench/system_profiler";
  return tools;
}

GpuStatus nvidiaCapability() {
  GpuStatus status{};
  status.gpuAvailable = true;
  status.backend = "NVIDIA: NVIDIA GeForce RTX 4090, 24564 MiB";
  return status;
}

} // namespace

/* ----------------------------- GpuStatus Tests ----------------------------- */

/** @test Defaults describe "no GPU". */
TEST(GpuStatusTest, Defaults) {
  const GpuStatus S{};
  EXPECT_FALSE(S.gpuAvailable);
  EXPECT_FALSE(S.gpuInUse);
  EXPECT_EQ(S.gpuLayers, "N/A");
  EXPECT_EQ(S.backend, "None");
  EXPECT_STREQ(S.usageLabel(), "No");
}

/** @test Usage label distinguishes idle-but-available from in-use. */
TEST(GpuStatusTest, UsageLabel) {
  GpuStatus s = nvidiaCapability();
  EXPECT_STREQ(s.usageLabel(), "Available but not used");
  s.gpuInUse = true;
  EXPECT_STREQ(s.usageLabel(), "Yes");
  EXPECT_NE(s.toString().find("Yes"), std::string::npos);
}

/* ----------------------------- nvidiaBackend Tests ----------------------------- */

/** @test Multiple GPUs are joined on one line. */
TEST(NvidiaBackendTest, JoinsLines) {
  EXPECT_EQ(nvidiaBackend("NVIDIA A100, 81920 MiB\nNVIDIA A100, 81920 MiB\n"),
            "NVIDIA: NVIDIA A100, 81920 MiB; NVIDIA A100, 81920 MiB");
  EXPECT_EQ(nvidiaBackend("  \n"), "");
}

/* ----------------------------- applyProcessTable Tests ----------------------------- */

/** @test GPU row marks the runtime as using the GPU and keeps the full split. */
TEST(ApplyProcessTableTest, GpuInUse) {
  const GpuStatus S = applyProcessTable(nvidiaCapability(), parseProcessTable(PS_GPU));
  EXPECT_TRUE(S.gpuInUse);
  EXPECT_TRUE(S.gpuAvailable);
  EXPECT_EQ(S.gpuLayers, "100% GPU");
  EXPECT_EQ(S.backend, nvidiaCapability().backend);
}

/** @test Empty table keeps capability values with gpuInUse=false. */
TEST(ApplyProcessTableTest, NothingLoaded) {
  const GpuStatus S = applyProcessTable(nvidiaCapability(), parseProcessTable(PS_EMPTY));
  EXPECT_FALSE(S.gpuInUse);
  EXPECT_TRUE(S.gpuAvailable);
  EXPECT_EQ(S.gpuLayers, "N/A");
}

/** @test GPU use without a detected GPU raises availability (invariant holds). */
TEST(ApplyProcessTableTest, InUseImpliesAvailable) {
  const GpuStatus S = applyProcessTable(GpuStatus{}, parseProcessTable(PS_GPU));
  EXPECT_TRUE(S.gpuInUse);
  EXPECT_TRUE(S.gpuAvailable);
  EXPECT_EQ(S.backend, "Detected via runtime");
}

/* ----------------------------- reconcileGpuStatus Tests ----------------------------- */

/** @test A later in-use reading supersedes an earlier idle one. */
TEST(ReconcileTest, LatestInUseWins) {
  GpuStatus first{};
  first.gpuInUse = false;

  GpuStatus second{};
  second.gpuAvailable = true;
  second.gpuInUse = true;
  second.gpuLayers = "100% GPU";

  const GpuStatus FINAL = reconcileGpuStatus(first, second);
  EXPECT_TRUE(FINAL.gpuInUse);
  EXPECT_EQ(FINAL.gpuLayers, "100% GPU");
}

/** @test A later idle reading does not erase an earlier in-use reading. */
TEST(ReconcileTest, LaterIdleKeepsEarlier) {
  GpuStatus first = nvidiaCapability();
  first.gpuInUse = true;
  first.gpuLayers = "100% GPU";

  const GpuStatus FINAL = reconcileGpuStatus(first, nvidiaCapability());
  EXPECT_TRUE(FINAL.gpuInUse);
  EXPECT_EQ(FINAL.gpuLayers, "100% GPU");
}

/** @test Chained reconciliation over three passes keeps the latest in-use reading. */
TEST(ReconcileTest, ThreePasses) {
  const GpuStatus INITIAL = nvidiaCapability();
  GpuStatus mid = nvidiaCapability();
  mid.gpuInUse = true;
  mid.gpuLayers = "48%/52% CPU/GPU";
  GpuStatus last = nvidiaCapability();
  last.gpuInUse = true;
  last.gpuLayers = "100% GPU";

  const GpuStatus FINAL = reconcileGpuStatus(reconcileGpuStatus(INITIAL, mid), last);
  EXPECT_EQ(FINAL.gpuLayers, "100% GPU");
}

/* ----------------------------- checkGpuUsage Tests ----------------------------- */

class GpuUsageRuntimeTest : public ::testing::Test {
protected:
  FakeRuntime rt_;

  void SetUp() override {
    if (!rt_.usable()) {
      GTEST_SKIP() << "cannot create fake runtime";
    }
  }
};

/** @test Usage pass parses the live `ps` table. */
TEST_F(GpuUsageRuntimeTest, ParsesLiveTable) {
  rt_.on("ps", FakeRuntime::emit(PS_GPU));
  ASSERT_TRUE(rt_.install());

  const GpuStatus S = checkGpuUsage(rt_.config(), nvidiaCapability());
  EXPECT_TRUE(S.gpuInUse);
  EXPECT_EQ(S.gpuLayers, "100% GPU");
}

/** @test Failing `ps` keeps capability values and reports no GPU use. */
TEST_F(GpuUsageRuntimeTest, PsFailureKeepsCapability) {
  rt_.on("ps", "echo 'Error: could not connect' 1>&2; exit 1");
  ASSERT_TRUE(rt_.install());

  GpuStatus capability = nvidiaCapability();
  capability.gpuInUse = true; // stale flag must not survive a failed pass
  const GpuStatus S = checkGpuUsage(rt_.config(), capability);
  EXPECT_FALSE(S.gpuInUse);
  EXPECT_TRUE(S.gpuAvailable);
  EXPECT_EQ(S.backend, capability.backend);
}

/** @test Missing runtime binary is tolerated. */
TEST(GpuUsageMissingRuntimeTest, MissingBinary) {
  modelbench::runtime::RuntimeConfig cfg{};
  cfg.binary = "/nonexistent/modelbench/ollama";
  const GpuStatus S = checkGpuUsage(cfg, GpuStatus{});
  EXPECT_FALSE(S.gpuInUse);
  EXPECT_FALSE(S.gpuAvailable);
}

/** @test Idle first pass then busy second pass reconciles to the busy reading. */
TEST_F(GpuUsageRuntimeTest, BeforeAndAfterSweep) {
  rt_.on("ps", FakeRuntime::emit(PS_EMPTY));
  ASSERT_TRUE(rt_.install());
  const GpuStatus BEFORE = checkGpuUsage(rt_.config(), nvidiaCapability());
  EXPECT_FALSE(BEFORE.gpuInUse);

  rt_.on("ps", FakeRuntime::emit(PS_GPU));
  ASSERT_TRUE(rt_.install());
  const GpuStatus AFTER = checkGpuUsage(rt_.config(), nvidiaCapability());

  const GpuStatus FINAL = reconcileGpuStatus(BEFORE, AFTER);
  EXPECT_TRUE(FINAL.gpuInUse);
  EXPECT_EQ(FINAL.gpuLayers, "100% GPU");
}

/* ----------------------------- checkGpuCapability Tests ----------------------------- */

/** @test Missing vendor tools fall back to {false, "None"}. */
TEST(GpuCapabilityTest, MissingToolsNoGpu) {
  if (!isLinux()) {
    GTEST_SKIP() << "Linux-only probe";
  }
  const GpuStatus S = checkGpuCapability(modelbench::runtime::RuntimeConfig{}, missingTools());
  EXPECT_FALSE(S.gpuAvailable);
  EXPECT_FALSE(S.gpuInUse);
  EXPECT_EQ(S.backend, "None");
}

/** @test nvidia-smi query output becomes the backend description. */
TEST(GpuCapabilityTest, NvidiaDetected) {
  if (!isLinux()) {
    GTEST_SKIP() << "Linux-only probe";
  }
  FakeRuntime smi;
  if (!smi.usable()) {
    GTEST_SKIP() << "cannot create fake tool";
  }
  smi.on("--query-gpu=name,memory.total", FakeRuntime::emit("NVIDIA GeForce RTX 4090, 24564 MiB"));
  ASSERT_TRUE(smi.install());

  GpuQueryTools tools = missingTools();
  tools.nvidiaSmi = smi.scriptPath();
  const GpuStatus S = checkGpuCapability(modelbench::runtime::RuntimeConfig{}, tools);
  EXPECT_TRUE(S.gpuAvailable);
  EXPECT_EQ(S.backend, "NVIDIA: NVIDIA GeForce RTX 4090, 24564 MiB");
}

/** @test rocm-smi is consulted when nvidia-smi is unavailable. */
TEST(GpuCapabilityTest, RocmFallback) {
  if (!isLinux()) {
    GTEST_SKIP() << "Linux-only probe";
  }
  FakeRuntime rocm;
  if (!rocm.usable()) {
    GTEST_SKIP() << "cannot create fake tool";
  }
  rocm.on("--showproductname", FakeRuntime::emit("Card series: Radeon RX 7900 XTX"));
  ASSERT_TRUE(rocm.install());

  GpuQueryTools tools = missingTools();
  tools.rocmSmi = rocm.scriptPath();
  const GpuStatus S = checkGpuCapability(modelbench::runtime::RuntimeConfig{}, tools);
  EXPECT_TRUE(S.gpuAvailable);
  EXPECT_EQ(S.backend, "AMD ROCm");
}

/** @test Full detection never reports in-use without availability. */
TEST_F(GpuUsageRuntimeTest, DetectInvariant) {
  rt_.on("ps", FakeRuntime::emit(PS_GPU));
  ASSERT_TRUE(rt_.install());

  const GpuStatus S = detectGpuStatus(rt_.config(), missingTools());
  if (S.gpuInUse) {
    EXPECT_TRUE(S.gpuAvailable);
  }
  EXPECT_TRUE(S.gpuInUse);
}
