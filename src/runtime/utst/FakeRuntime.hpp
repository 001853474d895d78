#ifndef MODELBENCH_RUNTIME_UTST_FAKE_RUNTIME_HPP
#define MODELBENCH_RUNTIME_UTST_FAKE_RUNTIME_HPP
/**
 * @file FakeRuntime.hpp
 * @brief Test fixture that installs a shell script impersonating the runtime CLI.
 *
 * The script dispatches on its first argument ("ls", "ps", "run", "--version").
 * Each handler is a /bin/sh snippet; "run" handlers see the model as $2 and the
 * prompt as $3. Unknown subcommands exit 2.
 */

#include "src/runtime/inc/RuntimeCli.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>

namespace modelbench {
namespace testing {

class FakeRuntime {
public:
  FakeRuntime() {
    char dir[] = "/tmp/modelbench_rt_XXXXXX";
    if (::mkdtemp(dir) != nullptr) {
      dir_ = dir;
    }
  }

  ~FakeRuntime() {
    if (!dir_.empty()) {
      std::remove(scriptPath().c_str());
      ::rmdir(dir_.c_str());
    }
  }

  FakeRuntime(const FakeRuntime&) = delete;
  FakeRuntime& operator=(const FakeRuntime&) = delete;

  /// True if /bin/sh exists and the temp directory was created.
  [[nodiscard]] bool usable() const { return !dir_.empty() && ::access("/bin/sh", X_OK) == 0; }

  /// Register a handler snippet for a subcommand.
  FakeRuntime& on(const std::string& subcommand, const std::string& body) {
    handlers_[subcommand] = body;
    return *this;
  }

  /// Shell snippet printing text verbatim.
  [[nodiscard]] static std::string emit(const std::string& text) {
    return "cat <<'MODELBENCH_EOF'\n" + text + "\nMODELBENCH_EOF";
  }

  /// Write the script; call after registering handlers.
  bool install() const {
    std::ofstream out(scriptPath());
    if (!out) {
      return false;
    }
    out << "#!/bin/sh\ncase \"$1\" in\n";
    for (const auto& KV : handlers_) {
      out << "  " << KV.first << ")\n" << KV.second << "\n    ;;\n";
    }
    out << "  *)\n    echo \"unknown command: $1\" 1>&2\n    exit 2\n    ;;\nesac\n";
    out.close();
    return ::chmod(scriptPath().c_str(), 0755) == 0;
  }

  [[nodiscard]] std::string scriptPath() const { return dir_ + "/fake-runtime"; }

  [[nodiscard]] runtime::RuntimeConfig config(double queryTimeoutSec = 5.0) const {
    runtime::RuntimeConfig cfg{};
    cfg.binary = scriptPath();
    cfg.queryTimeoutSec = queryTimeoutSec;
    return cfg;
  }

private:
  std::string dir_;
  std::map<std::string, std::string> handlers_;
};

} // namespace testing
} // namespace modelbench

#endif // MODELBENCH_RUNTIME_UTST_FAKE_RUNTIME_HPP
