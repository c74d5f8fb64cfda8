#pragma once

#include "core/error.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <stop_token>
#include <string>

namespace pty {

inline constexpr std::uint16_t kDefaultCols = 120;
inline constexpr std::uint16_t kDefaultRows = 40;
inline constexpr std::uint16_t kMinCols = 20;
inline constexpr std::uint16_t kMaxCols = 400;
inline constexpr std::uint16_t kMinRows = 5;
inline constexpr std::uint16_t kMaxRows = 200;

inline std::uint16_t ClampCols(std::uint32_t cols) {
  return static_cast<std::uint16_t>(
      std::clamp<std::uint32_t>(cols, kMinCols, kMaxCols));
}

inline std::uint16_t ClampRows(std::uint32_t rows) {
  return static_cast<std::uint16_t>(
      std::clamp<std::uint32_t>(rows, kMinRows, kMaxRows));
}

struct TerminalSize {
  std::uint16_t cols = kDefaultCols;
  std::uint16_t rows = kDefaultRows;

  bool operator==(const TerminalSize &) const = default;
};

inline TerminalSize ClampSize(std::uint32_t cols, std::uint32_t rows) {
  return {.cols = ClampCols(cols), .rows = ClampRows(rows)};
}

using EnvOverrides = std::map<std::string, std::string>;

// Caller-facing options of one Start() call.
struct StartOptions {
  std::string command;
  std::optional<std::string> cwd;
  std::optional<EnvOverrides> env;
  std::optional<std::uint32_t> cols;
  std::optional<std::uint32_t> rows;
  std::optional<std::chrono::milliseconds> timeout;
  // External cancellation: a stop request cancels the run.
  std::optional<std::stop_token> signal;
};

// What the run loop executes. Fixed for the lifetime of a run.
struct SessionConfig {
  std::string command;
  std::optional<std::string> cwd;
  std::optional<EnvOverrides> env;
  TerminalSize size;
};

inline SessionConfig MakeSessionConfig(const StartOptions &opt) {
  return SessionConfig{
      .command = opt.command,
      .cwd = opt.cwd,
      .env = opt.env,
      .size = ClampSize(opt.cols.value_or(kDefaultCols),
                        opt.rows.value_or(kDefaultRows)),
  };
}

struct RunResult {
  std::optional<int> exit_code;
  bool cancelled = false;
  bool timed_out = false;
};

using RunOutcome = std::expected<RunResult, boost::system::error_code>;

} // namespace pty
