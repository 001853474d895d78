/**
 * @file RuntimeCli_uTest.cpp
 * @brief Unit tests for modelbench::runtime (argv builders, ls parsing, listModels).
 */

#include "src/runtime/inc/RuntimeCli.hpp"
#include "src/runtime/utst/FakeRuntime.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using modelbench::runtime::generateArgv;
using modelbench::runtime::listModels;
using modelbench::runtime::listModelsArgv;
using modelbench::runtime::parseModelList;
using modelbench::runtime::processTableArgv;
using modelbench::runtime::RuntimeConfig;
using modelbench::runtime::versionArgv;
using modelbench::testing::FakeRuntime;

namespace {

constexpr const char* LS_OUTPUT = "NAME            ID              SIZE      MODIFIED\n"
                                  "mistral:7b      6577803aa9a0    4.4 GB    2 weeks ago\n"
                                  "\n"
                                  "gpt-oss:20b     17052f91a42e    13 GB     3 days ago\n";

} // namespace

/* ----------------------------- RuntimeConfig Tests ----------------------------- */

/** @test Default configuration targets ollama and is valid. */
TEST(RuntimeConfigTest, Defaults) {
  const RuntimeConfig CFG{};
  EXPECT_EQ(CFG.binary, "ollama");
  EXPECT_GT(CFG.queryTimeoutSec, 0.0);
  EXPECT_TRUE(CFG.isValid());
}

/** @test Empty binary or non-positive timeout is invalid. */
TEST(RuntimeConfigTest, Invalid) {
  RuntimeConfig cfg{};
  cfg.binary.clear();
  EXPECT_FALSE(cfg.isValid());

  cfg = RuntimeConfig{};
  cfg.queryTimeoutSec = 0.0;
  EXPECT_FALSE(cfg.isValid());
}

/* ----------------------------- Argument Builder Tests ----------------------------- */

/** @test Subcommand argv use the configured binary. */
TEST(RuntimeArgvTest, Builders) {
  RuntimeConfig cfg{};
  cfg.binary = "/opt/bin/ollama";
  EXPECT_EQ(listModelsArgv(cfg), (std::vector<std::string>{"/opt/bin/ollama", "ls"}));
  EXPECT_EQ(processTableArgv(cfg), (std::vector<std::string>{"/opt/bin/ollama", "ps"}));
  EXPECT_EQ(versionArgv(cfg), (std::vector<std::string>{"/opt/bin/ollama", "--version"}));
}

/** @test Prompt with spaces and quotes stays a single argument. */
TEST(RuntimeArgvTest, GeneratePromptSingleArgument) {
  const RuntimeConfig CFG{};
  const auto ARGV = generateArgv(CFG, "mistral:7b", "Say \"hi\" in 5 words; then stop.");
  ASSERT_EQ(ARGV.size(), 4U);
  EXPECT_EQ(ARGV[1], "run");
  EXPECT_EQ(ARGV[2], "mistral:7b");
  EXPECT_EQ(ARGV[3], "Say \"hi\" in 5 words; then stop.");
}

/* ----------------------------- parseModelList Tests ----------------------------- */

/** @test Header is skipped and blank lines ignored. */
TEST(ParseModelListTest, SkipsHeaderAndBlankLines) {
  const auto MODELS = parseModelList(LS_OUTPUT);
  ASSERT_EQ(MODELS.size(), 2U);
  EXPECT_EQ(MODELS[0], "mistral:7b");
  EXPECT_EQ(MODELS[1], "gpt-oss:20b");
}

/** @test Header-only and empty output produce no models. */
TEST(ParseModelListTest, EmptyTables) {
  EXPECT_TRUE(parseModelList("").empty());
  EXPECT_TRUE(parseModelList("NAME ID SIZE MODIFIED\n").empty());
}

/** @test CRLF line endings are tolerated. */
TEST(ParseModelListTest, CrLf) {
  const auto MODELS = parseModelList("NAME ID\r\nllama3:8b abc\r\n");
  ASSERT_EQ(MODELS.size(), 1U);
  EXPECT_EQ(MODELS[0], "llama3:8b");
}

/* ----------------------------- listModels Tests ----------------------------- */

/** @test listModels runs `ls` and parses its output. */
TEST(ListModelsTest, FromFakeRuntime) {
  FakeRuntime rt;
  if (!rt.usable()) {
    GTEST_SKIP() << "cannot create fake runtime";
  }
  rt.on("ls", FakeRuntime::emit(LS_OUTPUT));
  ASSERT_TRUE(rt.install());

  std::vector<std::string> models{"stale"};
  std::string error;
  ASSERT_TRUE(listModels(rt.config(), models, error)) << error;
  ASSERT_EQ(models.size(), 2U);
  EXPECT_EQ(models[0], "mistral:7b");
}

/** @test Missing runtime binary is an enumeration failure with a diagnostic. */
TEST(ListModelsTest, MissingBinary) {
  RuntimeConfig cfg{};
  cfg.binary = "/nonexistent/modelbench/ollama";
  std::vector<std::string> models;
  std::string error;
  EXPECT_FALSE(listModels(cfg, models, error));
  EXPECT_TRUE(models.empty());
  EXPECT_NE(error.find("ls"), std::string::npos);
}

/** @test Non-zero exit of `ls` is an enumeration failure. */
TEST(ListModelsTest, RuntimeError) {
  FakeRuntime rt;
  if (!rt.usable()) {
    GTEST_SKIP() << "cannot create fake runtime";
  }
  rt.on("ls", "echo 'could not connect to ollama app' 1>&2; exit 1");
  ASSERT_TRUE(rt.install());

  std::vector<std::string> models;
  std::string error;
  EXPECT_FALSE(listModels(rt.config(), models, error));
  EXPECT_NE(error.find("could not connect"), std::string::npos) << error;
}
