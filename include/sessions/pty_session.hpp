#pragma once

#include "core/cancel_token.hpp"
#include "core/config.hpp"
#include "core/control_channel.hpp"
#include "core/error.hpp"
#include "core/message.hpp"
#include "core/reactor.hpp"
#include "core/session_config.hpp"
#include "sessions/run_loop.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace pty {

// BasicRunSlot — the session's zero-or-one active run, i.e. the control
// channel of the run in flight. The only lock-protected state of a session;
// the lock is held for install/clear/send and never across a blocking call.
// An exception escaping while the lock is held poisons the slot and every
// later call reports lock_poisoned.
// Channel needs `Status Send(ControlMessage)`.
template <typename Channel> class BasicRunSlot {
public:
  Status TryInstall(std::shared_ptr<Channel> channel) {
    return Locked([&]() -> Status {
      if (channel_) {
        return Fail(errc::already_running);
      }
      channel_ = std::move(channel);
      return {};
    });
  }

  Status Clear() {
    return Locked([&]() -> Status {
      channel_.reset();
      return {};
    });
  }

  Status Send(const ControlMessage &msg) {
    return Locked([&]() -> Status {
      if (!channel_) {
        return Fail(errc::not_running);
      }
      return channel_->Send(msg);
    });
  }

  bool Occupied() {
    bool occupied = false;
    (void)Locked([&]() -> Status {
      occupied = static_cast<bool>(channel_);
      return {};
    });
    return occupied;
  }

private:
  template <typename Fn> Status Locked(Fn &&fn) {
    std::lock_guard<std::mutex> lock(m_);
    if (poisoned_) {
      return Fail(errc::lock_poisoned);
    }
    try {
      return fn();
    } catch (...) {
      poisoned_ = true;
      throw;
    }
  }

  std::mutex m_;
  std::shared_ptr<Channel> channel_;
  bool poisoned_ = false;
};

using RunSlot = BasicRunSlot<ControlChannel>;

// RunSlotLease — ownership of the slot for one run. Acquired by a single
// compare-and-install; released exactly once when the lease is destroyed, on
// every exit path of the run.
class RunSlotLease {
public:
  static std::expected<RunSlotLease, boost::system::error_code>
  Acquire(std::shared_ptr<RunSlot> slot,
          std::shared_ptr<ControlChannel> channel) {
    if (auto st = slot->TryInstall(std::move(channel)); !st) {
      return std::unexpected(st.error());
    }
    return RunSlotLease(std::move(slot));
  }

  RunSlotLease(const RunSlotLease &) = delete;
  RunSlotLease &operator=(const RunSlotLease &) = delete;
  RunSlotLease(RunSlotLease &&other) noexcept = default;
  RunSlotLease &operator=(RunSlotLease &&) = delete;

  ~RunSlotLease() {
    if (slot_) {
      // A poisoned slot stays poisoned; there is nothing left to release.
      (void)slot_->Clear();
    }
  }

private:
  explicit RunSlotLease(std::shared_ptr<RunSlot> slot)
      : slot_(std::move(slot)) {}

  std::shared_ptr<RunSlot> slot_;
};

// PtySession — handle for interactive PTY command execution.
// Threading model:
// - Start() installs a fresh ControlChannel and posts a RunLoop onto the
//   reactor's blocking pool; it never waits on the command
// - Write/Resize/Kill may be called from any thread; they only enqueue
// - Output chunks and the final result are delivered on a per-session strand
//   of the reactor's io_context, so the callback sees chunks in read order and
//   the future becomes ready after the last chunk was delivered
// - The slot is cleared before the result is delivered: once the future is
//   ready a new Start() is accepted
class PtySession {
public:
  using ChunkCallback = std::function<void(const std::string &)>;
  using StartResult =
      std::expected<std::future<RunOutcome>, boost::system::error_code>;

  explicit PtySession(Reactor &reactor, EngineConfig engine = {})
      : reactor_(reactor), engine_(std::move(engine)),
        strand_(net::make_strand(reactor.GetIoContext())),
        slot_(std::make_shared<RunSlot>()), index_(NextIndex()) {}

  PtySession(const PtySession &) = delete;
  PtySession &operator=(const PtySession &) = delete;

  StartResult Start(const StartOptions &options, ChunkCallback on_chunk = {}) {
    auto channel = std::make_shared<ControlChannel>();
    auto lease = RunSlotLease::Acquire(slot_, channel);
    if (!lease) {
      return std::unexpected(lease.error());
    }

    auto promise = std::make_shared<std::promise<RunOutcome>>();
    std::future<RunOutcome> future = promise->get_future();

    auto loop = std::make_shared<RunLoop>(
        MakeSessionConfig(options), engine_, channel,
        MakeSink(std::move(on_chunk)),
        CancelToken(options.timeout, options.signal), index_);
    auto held = std::make_shared<RunSlotLease>(std::move(*lease));

    net::post(reactor_.GetBlockingPool(),
              [loop, held, promise, strand = strand_,
               index = index_]() mutable {
                RunOutcome outcome = RunGuarded(*loop, index);
                loop.reset();
                held.reset();
                net::post(strand, [promise, outcome = std::move(outcome)]() {
                  promise->set_value(outcome);
                });
              });
    return future;
  }

  Status Write(std::string data) {
    return slot_->Send(InputMessage{std::move(data)});
  }

  Status Resize(std::uint32_t cols, std::uint32_t rows) {
    return slot_->Send(ResizeMessage{ClampCols(cols), ClampRows(rows)});
  }

  Status Kill() { return slot_->Send(KillMessage{}); }

  bool Running() { return slot_->Occupied(); }

  int Index() const { return index_; }

private:
  using Strand = net::strand<net::io_context::executor_type>;

  ChunkSink MakeSink(ChunkCallback on_chunk) const {
    if (!on_chunk) {
      return {};
    }
    auto cb = std::make_shared<ChunkCallback>(std::move(on_chunk));
    return [strand = strand_, cb](std::string text) {
      net::post(strand, [cb, text = std::move(text)]() { (*cb)(text); });
    };
  }

  static RunOutcome RunGuarded(RunLoop &loop, int index) {
    try {
      return loop.Run();
    } catch (const std::exception &e) {
      std::cerr << "[pty_session " << index << "] run error: " << e.what()
                << "\n";
      return Fail(errc::run_failed);
    }
  }

  static int NextIndex() {
    static std::atomic<int> next{0};
    return next.fetch_add(1, std::memory_order_relaxed);
  }

  Reactor &reactor_;
  EngineConfig engine_;
  Strand strand_;
  std::shared_ptr<RunSlot> slot_;
  int index_;
};

} // namespace pty
