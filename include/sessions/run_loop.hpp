#pragma once

#include "core/cancel_token.hpp"
#include "core/config.hpp"
#include "core/control_channel.hpp"
#include "core/error.hpp"
#include "core/message.hpp"
#include "core/session_config.hpp"
#include "io/file_writer.hpp"
#include "pty/pty_process.hpp"
#include "sessions/reader_worker.hpp"
#include "util/branch.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>

namespace pty {

// Receives each decoded chunk. Must not block: the session wraps the caller's
// callback so that delivery is posted elsewhere.
using ChunkSink = std::function<void(std::string)>;

// RunLoop — coordinator for one command.
// Threading model:
// - Run() executes on a blocking-pool thread and is the only code that
//   touches the master, the writer handle and the child
// - Inputs per tick: cancel token, ControlChannel (from caller threads),
//   ReaderQueue (from the ReaderWorker jthread)
// - Phases: setup (PTY, spawn, reader) -> pump until the child has exited and
//   the reader reported Done -> drain (final wait, join reader) -> result
// - In-loop writes, resizes and kills are best-effort: the PTY may already be
//   closing and that must not cut short the remaining output
class RunLoop {
public:
  RunLoop(SessionConfig config, EngineConfig engine,
          std::shared_ptr<ControlChannel> control, ChunkSink sink,
          CancelToken cancel, int index)
      : config_(std::move(config)), engine_(std::move(engine)),
        control_(std::move(control)), sink_(std::move(sink)),
        cancel_(std::move(cancel)), index_(index),
        reader_queue_(std::make_shared<ReaderQueue>()) {}

  RunLoop(const RunLoop &) = delete;
  RunLoop &operator=(const RunLoop &) = delete;

  RunOutcome Run() {
    // The receiver goes away with the loop, whatever the exit path.
    struct CloseOnExit {
      ControlChannel &channel;
      ~CloseOnExit() { channel.Close(); }
    } close_control{*control_};

    if (auto st = Setup(); PTYRUN_UNLIKELY(!st)) {
      return std::unexpected(st.error());
    }
    if (auto st = Pump(); PTYRUN_UNLIKELY(!st)) {
      return std::unexpected(st.error());
    }
    if (auto st = Drain(); PTYRUN_UNLIKELY(!st)) {
      return std::unexpected(st.error());
    }
    return RunResult{
        .exit_code = exit_code_, .cancelled = cancelled_, .timed_out = timed_out_};
  }

private:
  // PTY open → spawn `sh -lc` → release slave → writer/reader handles →
  // reader thread
  Status Setup() {
    auto pair = OpenPty(config_.size);
    if (!pair) {
      OnError("open pty", pair.error());
      return Fail(errc::pty_open_failed);
    }

    auto child = ChildProcess::Spawn(
        SpawnRequest::ForShellCommand(config_, engine_), pair->slave.Get());
    if (!child) {
      OnError("spawn", child.error());
      return Fail(errc::spawn_failed);
    }
    child_.emplace(std::move(*child));
    pair->slave.Reset();
    master_ = std::move(pair->master);

    auto writer = DupCloexec(master_.Get());
    if (!writer) {
      OnError("writer", writer.error());
      return Fail(errc::writer_failed);
    }
    writer_ = std::move(*writer);
    // O_NONBLOCK lives on the shared file description: input writes never
    // stall the loop, and the reader waits in poll() instead.
    if (!SetNonBlocking(master_.Get())) {
      OnError("writer", LastOsError());
      return Fail(errc::writer_failed);
    }

    auto reader = DupCloexec(master_.Get());
    if (!reader) {
      OnError("reader", reader.error());
      return Fail(errc::reader_failed);
    }
    reader_.emplace(std::move(*reader), reader_queue_);
    try {
      reader_->Start();
    } catch (const std::system_error &e) {
      std::cerr << "[pty_session " << index_
                << "] reader error: " << e.what() << "\n";
      reader_.reset();
      return Fail(errc::reader_failed);
    }
    return {};
  }

  Status Pump() {
    while (!exit_code_.has_value() || !reader_done_) {
      CheckCancel();
      DrainControl();
      FlushInput();
      DrainReader();

      if (!exit_code_.has_value()) {
        auto status = child_->TryWait();
        if (PTYRUN_UNLIKELY(!status)) {
          OnError("status", status.error());
          return Fail(errc::status_check_failed);
        }
        if (status->has_value()) {
          exit_code_ = **status;
        }
      }

      if (!exit_code_.has_value() || !reader_done_) {
        std::this_thread::sleep_for(engine_.poll_interval);
      }
    }
    return {};
  }

  Status Drain() {
    if (!exit_code_.has_value()) {
      auto code = child_->Wait();
      if (!code) {
        OnError("wait", code.error());
        return Fail(errc::wait_failed);
      }
      exit_code_ = *code;
    }
    reader_->Join();
    return {};
  }

  void CheckCancel() {
    auto hb = cancel_.Heartbeat();
    if (PTYRUN_LIKELY(hb.has_value())) {
      return;
    }
    if (!cancelled_ && !timed_out_) {
      timed_out_ = hb.error() == CancelReason::timeout;
      cancelled_ = !timed_out_;
      std::cerr << "[pty_session " << index_ << "] "
                << (timed_out_ ? "timed out" : "cancelled") << ", killing pid "
                << child_->Pid() << "\n";
    }
    if (!cancel_kill_issued_) {
      cancel_kill_issued_ = true;
      child_->Kill();
    }
  }

  void DrainControl() {
    control_->Drain([this](ControlMessage &msg) {
      if (auto *input = std::get_if<InputMessage>(&msg)) {
        if (!input_closed_) {
          pending_input_ += input->data;
        }
      } else if (auto *resize = std::get_if<ResizeMessage>(&msg)) {
        (void)ResizePty(master_.Get(), ClampSize(resize->cols, resize->rows));
      } else {
        if (!cancelled_ && !timed_out_) {
          cancelled_ = true;
        }
        child_->Kill();
      }
    });
  }

  // Writes what the PTY accepts now and keeps the rest for the next tick, so
  // a child that stops reading its input cannot stall the loop. A hard error
  // (the PTY closing) discards pending and future input.
  void FlushInput() {
    if (pending_input_.empty() || input_closed_) {
      return;
    }
    ssize_t n = io::WriteSome(writer_.Get(), pending_input_.data(),
                              pending_input_.size());
    if (n < 0) {
      input_closed_ = true;
      pending_input_.clear();
      return;
    }
    pending_input_.erase(0, static_cast<std::size_t>(n));
  }

  void DrainReader() {
    while (!reader_done_) {
      const bool got = reader_queue_->consume_one([this](ReaderEvent &ev) {
        if (auto *chunk = std::get_if<ChunkEvent>(&ev)) {
          if (sink_) {
            sink_(std::move(chunk->text));
          }
        } else {
          reader_done_ = true;
        }
      });
      if (!got) {
        break;
      }
    }
  }

  void OnError(const char *stage, const boost::system::error_code &ec) {
    std::cerr << "[pty_session " << index_ << "] " << stage
              << " error: " << ec.message() << "\n";
  }

  SessionConfig config_;
  EngineConfig engine_;
  std::shared_ptr<ControlChannel> control_;
  ChunkSink sink_;
  CancelToken cancel_;
  int index_;

  std::shared_ptr<ReaderQueue> reader_queue_;
  io::UniqueFd master_;
  io::UniqueFd writer_;
  // Declared before child_ so that on an error path the child is killed and
  // reaped first, which lets the reader see EOF before it is joined.
  std::optional<ReaderWorker> reader_;
  std::optional<ChildProcess> child_;

  std::optional<int> exit_code_;
  bool reader_done_ = false;
  bool cancelled_ = false;
  bool timed_out_ = false;
  bool cancel_kill_issued_ = false;
  bool input_closed_ = false;
  std::string pending_input_;
};

} // namespace pty
