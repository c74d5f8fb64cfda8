#pragma once

#include "io/file_writer.hpp"
#include "util/branch.hpp"
#include <array>
#include <atomic>
#include <boost/lockfree/spsc_queue.hpp>
#include <chrono>
#include <cstddef>
#include <fcntl.h>
#include <string>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace logging {

inline constexpr std::size_t kTranscriptRingCapacity = 4096;

using TranscriptQueue = boost::lockfree::spsc_queue<
    std::string, boost::lockfree::capacity<kTranscriptRingCapacity>>;

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ =
        std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// TranscriptLogger
// Threading model:
// - The owner of one output stream is the single producer (Append)
// - One background thread is the single consumer; it writes batches with
//   writev and sleeps briefly when the queue is empty
// - Join() drains whatever was appended before it was called
class TranscriptLogger : public LoggerBase<TranscriptLogger> {
public:
  static constexpr std::size_t kBatch = 64;
  static constexpr std::chrono::milliseconds kIdleSleep{2};

  explicit TranscriptLogger(const std::string &path)
      : path_(path), fd_(::open(path.c_str(),
                                O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC,
                                0644)) {}

  ~TranscriptLogger() { Join(); }

  bool OpenOk() const { return fd_.Valid(); }
  const std::string &Path() const { return path_; }

  // Producer API. A full ring is waited out; transcript bytes are not dropped.
  void Append(const std::string &text) {
    if (PTYRUN_UNLIKELY(!fd_.Valid() || text.empty())) {
      return;
    }
    while (!queue_.push(text)) {
      std::this_thread::yield();
    }
  }

  void RunLoop() {
    for (;;) {
      const bool stopping = !this->running_.load(std::memory_order_relaxed);
      const std::size_t n = DrainQueue();
      if (PTYRUN_UNLIKELY(stopping)) {
        while (DrainQueue() != 0) {
        }
        break;
      }
      if (n == 0) {
        std::this_thread::sleep_for(kIdleSleep);
      }
    }
  }

private:
  std::size_t DrainQueue() {
    std::array<std::string, kBatch> batch;
    struct iovec iov[kBatch];
    std::size_t total = 0;
    for (;;) {
      int cnt = 0;
      while (cnt < static_cast<int>(kBatch) && queue_.pop(batch[cnt])) {
        iov[cnt] = {batch[cnt].data(), batch[cnt].size()};
        ++cnt;
      }
      if (cnt == 0) {
        return total;
      }
      io::WritevAll(fd_.Get(), iov, cnt);
      total += static_cast<std::size_t>(cnt);
    }
  }

  std::string path_;
  io::UniqueFd fd_;
  TranscriptQueue queue_;
};

} // namespace logging
