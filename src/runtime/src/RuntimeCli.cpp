/**
 * @file RuntimeCli.cpp
 * @brief Runtime CLI argument builders and model enumeration.
 */

#include "src/runtime/inc/RuntimeCli.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/process/inc/Command.hpp"

#include <fmt/core.h>

namespace modelbench {

namespace runtime {

namespace {

using modelbench::helpers::strings::splitLines;
using modelbench::helpers::strings::splitWhitespace;

} // namespace

/* ----------------------------- RuntimeConfig ----------------------------- */

bool RuntimeConfig::isValid() const noexcept { return !binary.empty() && queryTimeoutSec > 0.0; }

/* ----------------------------- Argument Builders ----------------------------- */

std::vector<std::string> listModelsArgv(const RuntimeConfig& config) { return {config.binary, "ls"}; }

std::vector<std::string> processTableArgv(const RuntimeConfig& config) {
  return {config.binary, "ps"};
}

std::vector<std::string> versionArgv(const RuntimeConfig& config) {
  return {config.binary, "--version"};
}

std::vector<std::string> generateArgv(const RuntimeConfig& config, std::string_view model,
                                      std::string_view prompt) {
  return {config.binary, "run", std::string(model), std::string(prompt)};
}

/* ----------------------------- Parsing ----------------------------- */

std::vector<std::string> parseModelList(std::string_view text) {
  std::vector<std::string> models;
  const std::vector<std::string_view> LINES = splitLines(text);

  // Line 0 is the column header (NAME ID SIZE MODIFIED).
  for (std::size_t i = 1; i < LINES.size(); ++i) {
    const std::vector<std::string_view> TOKENS = splitWhitespace(LINES[i]);
    if (!TOKENS.empty()) {
      models.emplace_back(TOKENS.front());
    }
  }
  return models;
}

/* ----------------------------- API ----------------------------- */

bool listModels(const RuntimeConfig& config, std::vector<std::string>& models,
                std::string& error) noexcept {
  models.clear();

  const process::CommandResult RESULT =
      process::runCommand(listModelsArgv(config), config.queryTimeoutSec);
  if (!RESULT.ok()) {
    error = fmt::format("'{} ls' failed: {}", config.binary, RESULT.failureMessage());
    return false;
  }

  models = parseModelList(RESULT.stdoutText);
  return true;
}

} // namespace runtime

} // namespace modelbench
