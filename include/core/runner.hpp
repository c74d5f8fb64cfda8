#pragma once

#include "core/config.hpp"
#include "core/reactor.hpp"
#include "core/session_config.hpp"
#include "output/output_sink.hpp"
#include "sessions/pty_session.hpp"
#include "util/time.hpp"
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <poll.h>
#include <stop_token>
#include <string>
#include <thread>
#include <unistd.h>

// Runner composition/threading overview:
// - Reactor: io_context on 1 thread delivers chunks/results and catches
//   SIGINT/SIGTERM; its blocking pool hosts the RunLoop
// - PtySession: one command; RunLoop + ReaderWorker threads per run
// - OutputSink: receives chunks on the session strand, echoes them to stdout,
//   spills to a transcript file past the threshold
// - StdinPump: dedicated jthread forwarding raw stdin bytes via Write()
// - Main thread: waits on the run's future, then prints a summary
struct RunOptions {
  std::string command;
  std::optional<std::string> cwd;
  pty::EnvOverrides env;
  std::optional<std::uint32_t> cols;
  std::optional<std::uint32_t> rows;
  std::optional<std::chrono::milliseconds> timeout;
  std::string transcriptDir = "/tmp";
  std::size_t maxBuffer = 50 * 1024;
  std::size_t spillThreshold = 50 * 1024;
  bool forwardStdin = true;
};

inline constexpr int kExitTimedOut = 124;
inline constexpr int kExitCancelled = 130;

// StdinPump — forwards whatever arrives on stdin to the running command.
// Stops at EOF, on a stop request, or once the session no longer accepts
// input.
class StdinPump {
public:
  explicit StdinPump(pty::PtySession &session) : session_(session) {}

  void Start() {
    worker_ = std::jthread([this](std::stop_token st) { this->Run(st); });
  }

  ~StdinPump() {
    worker_.request_stop();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

private:
  void Run(std::stop_token st) {
    char buf[4096];
    struct pollfd pfd {
      STDIN_FILENO, POLLIN, 0
    };
    while (!st.stop_requested()) {
      int rc = ::poll(&pfd, 1, 100);
      if (rc <= 0) {
        continue;
      }
      ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (n <= 0) {
        return;
      }
      if (auto s = session_.Write(std::string(buf, static_cast<std::size_t>(n)));
          !s) {
        return;
      }
    }
  }

  pty::PtySession &session_;
  std::jthread worker_;
};

inline int Run(const RunOptions &opt) {
  Reactor reactor(1);
  reactor.Start(1);

  std::stop_source interrupt;
  net::signal_set signals(reactor.GetIoContext(), SIGINT, SIGTERM);
  signals.async_wait(
      [&interrupt](const boost::system::error_code &ec, int signo) {
        if (!ec) {
          std::cerr << "[ptyrun] caught signal " << signo << ", cancelling\n";
          interrupt.request_stop();
        }
      });

  output::OutputSink sink(output::SinkOptions{
      .max_buffer = opt.maxBuffer,
      .spill_threshold = opt.spillThreshold,
      .transcript_dir = opt.transcriptDir,
      .on_chunk = [](const std::string &text) { std::cout << text << std::flush; },
  });
  pty::PtySession session(reactor, pty::EngineConfig::FromEnvironment());

  pty::StartOptions so{
      .command = opt.command,
      .cwd = opt.cwd,
      .env = opt.env.empty() ? std::nullopt
                             : std::optional<pty::EnvOverrides>(opt.env),
      .cols = opt.cols,
      .rows = opt.rows,
      .timeout = opt.timeout,
      .signal = interrupt.get_token(),
  };
  const auto started_at = std::chrono::steady_clock::now();
  auto started =
      session.Start(so, [&sink](const std::string &text) { sink.Push(text); });
  if (!started) {
    std::cerr << "[ptyrun] start error: " << started.error().message() << "\n";
    return 1;
  }

  std::optional<StdinPump> pump;
  if (opt.forwardStdin) {
    pump.emplace(session);
    pump->Start();
  }

  pty::RunOutcome outcome = started->get();
  pump.reset();
  boost::system::error_code ignored;
  signals.cancel(ignored);

  if (!outcome) {
    std::cerr << "[ptyrun] run error: " << outcome.error().message() << "\n";
    return 1;
  }

  const pty::RunResult &r = *outcome;
  const output::OutputSummary summary = sink.Dump();
  std::cerr << "\n[ptyrun] exit="
            << (r.exit_code.has_value() ? std::to_string(*r.exit_code) : "none")
            << " cancelled=" << std::boolalpha << r.cancelled
            << " timed_out=" << r.timed_out << " bytes=" << summary.total_bytes
            << " lines=" << summary.total_lines << " elapsed="
            << timeutil::FormatElapsed(std::chrono::steady_clock::now() -
                                       started_at);
  if (summary.transcript_path.has_value()) {
    std::cerr << " transcript=" << *summary.transcript_path;
  }
  std::cerr << "\n";

  if (r.timed_out) {
    return kExitTimedOut;
  }
  if (r.cancelled) {
    return kExitCancelled;
  }
  return r.exit_code.value_or(1);
}
