#pragma once

#include "core/error.hpp"
#include "core/message.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace pty {

// ControlChannel — carries Input/Resize/Kill from the session handle into the
// run loop.
// - Unbounded: a send to a live channel never fails, so a Kill queued behind a
//   burst of input is still delivered
// - Single consumer: the run loop drains it once per iteration by swapping the
//   pending batch out, then handles it without holding the lock
// - Close() is the receiver going away: the run loop calls it on exit, and any
//   later Send reports session_gone instead of silently queueing
class ControlChannel {
public:
  ControlChannel() = default;
  ControlChannel(const ControlChannel &) = delete;
  ControlChannel &operator=(const ControlChannel &) = delete;

  Status Send(ControlMessage msg) {
    std::lock_guard<std::mutex> lock(m_);
    if (closed_) {
      return Fail(errc::session_gone);
    }
    pending_.push_back(std::move(msg));
    return {};
  }

  // Applies `fn` to every message queued at the time of the call, in send
  // order. Returns the number of messages consumed.
  template <typename Fn> std::size_t Drain(Fn &&fn) {
    std::deque<ControlMessage> batch;
    {
      std::lock_guard<std::mutex> lock(m_);
      batch.swap(pending_);
    }
    for (auto &msg : batch) {
      fn(msg);
    }
    return batch.size();
  }

  void Close() {
    std::lock_guard<std::mutex> lock(m_);
    closed_ = true;
  }

  bool Closed() const {
    std::lock_guard<std::mutex> lock(m_);
    return closed_;
  }

private:
  mutable std::mutex m_;
  std::deque<ControlMessage> pending_;
  bool closed_ = false;
};

} // namespace pty
