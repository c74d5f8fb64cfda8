#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <utility>

namespace pty {

enum class CancelReason { timeout, aborted };

inline const char *ToString(CancelReason r) {
  return r == CancelReason::timeout ? "timeout" : "aborted";
}

// CancelToken — cooperative cancellation polled by the run loop.
// Combines an optional deadline with an optional external stop_token. Heartbeat
// never blocks; once it fails it keeps failing with the same reason.
class CancelToken {
public:
  using Clock = std::chrono::steady_clock;

  CancelToken() = default;

  CancelToken(std::optional<std::chrono::milliseconds> timeout,
              std::optional<std::stop_token> signal)
      : signal_(std::move(signal)) {
    if (timeout.has_value()) {
      deadline_ = Clock::now() + *timeout;
    }
  }

  std::expected<void, CancelReason> Heartbeat() const {
    if (signal_.has_value() && signal_->stop_requested()) {
      return std::unexpected(CancelReason::aborted);
    }
    if (deadline_.has_value() && Clock::now() >= *deadline_) {
      return std::unexpected(CancelReason::timeout);
    }
    return {};
  }

  std::optional<Clock::time_point> Deadline() const { return deadline_; }

private:
  std::optional<Clock::time_point> deadline_;
  std::optional<std::stop_token> signal_;
};

} // namespace pty
