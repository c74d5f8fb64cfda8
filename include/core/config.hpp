#pragma once

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace pty {

// EngineConfig — engine-wide policy handed to every PtySession at
// construction. Environment lookup happens once, in FromEnvironment(); nothing
// below the session re-reads the environment.
struct EngineConfig {
  // Interpreter for `<shell> -lc <command>`
  std::string shell = "sh";
  // Upper bound on one run-loop iteration when nothing is ready
  std::chrono::milliseconds poll_interval{16};
  // TERM exported to the child unless the caller's env overrides it
  std::string term = "xterm-256color";

  static EngineConfig FromEnvironment() {
    EngineConfig cfg;
    if (auto v = GetEnv("PTYRUN_SHELL"); v.has_value() && !v->empty()) {
      cfg.shell = *v;
    }
    if (auto v = GetEnv("PTYRUN_POLL_INTERVAL_MS"); v.has_value()) {
      if (auto ms = ParseMillis(*v); ms.has_value()) {
        cfg.poll_interval = *ms;
      }
    }
    if (auto v = GetEnv("PTYRUN_TERM"); v.has_value() && !v->empty()) {
      cfg.term = *v;
    }
    return cfg;
  }

  // Accepts 1..1000 ms; anything else is treated as absent.
  static std::optional<std::chrono::milliseconds>
  ParseMillis(std::string_view s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || value < 1 ||
        value > 1000) {
      return std::nullopt;
    }
    return std::chrono::milliseconds(value);
  }

private:
  static std::optional<std::string> GetEnv(const char *name) {
    const char *v = std::getenv(name);
    if (v == nullptr) {
      return std::nullopt;
    }
    return std::string(v);
  }
};

} // namespace pty
