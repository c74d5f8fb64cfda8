#pragma once

#include "core/message.hpp"
#include "io/file_writer.hpp"
#include "text/utf8_reassembler.hpp"
#include "util/branch.hpp"
#include <cerrno>
#include <memory>
#include <poll.h>
#include <stop_token>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>

namespace pty {

// ReaderWorker
// Threading model:
// - Owns one std::jthread performing blocking reads of the PTY master
// - Single producer of its ReaderQueue; the run loop is the single consumer
// - Publishes chunks in byte-stream order and exactly one DoneEvent at EOF or
//   on a read error (Linux reports EIO once the last slave fd is closed)
// - The master is non-blocking (the run loop's writer shares its file
//   description), so the thread blocks in poll() rather than read()
// - A stop request is only issued on teardown after a run-loop failure; in
//   normal operation the thread ends because the child's exit closes the slave
class ReaderWorker {
public:
  static constexpr int kPollTimeoutMs = 100;

  ReaderWorker(io::UniqueFd reader, std::shared_ptr<ReaderQueue> queue)
      : reader_(std::move(reader)), queue_(std::move(queue)) {}

  ReaderWorker(const ReaderWorker &) = delete;
  ReaderWorker &operator=(const ReaderWorker &) = delete;

  ~ReaderWorker() {
    if (worker_.joinable()) {
      worker_.request_stop();
      worker_.join();
    }
  }

  // Throws std::system_error if the thread cannot be created.
  void Start() {
    worker_ = std::jthread([this](std::stop_token st) { this->Run(st); });
  }

  void Join() {
    if (worker_.joinable()) {
      worker_.join();
    }
  }

private:
  void Run(std::stop_token st) {
    text::Utf8Reassembler reassembler;
    for (;;) {
      if (!WaitReadable(st)) {
        return;
      }
      ssize_t n = ::read(reader_.Get(), reassembler.ReadPtr(),
                         reassembler.ReadCapacity());
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
          continue;
        }
        break;
      }
      if (n == 0) {
        break;
      }
      std::string text = reassembler.Commit(static_cast<std::size_t>(n));
      if (!text.empty() && !Publish(ChunkEvent{std::move(text)}, st)) {
        return;
      }
    }
    std::string tail = reassembler.Finish();
    if (!tail.empty() && !Publish(ChunkEvent{std::move(tail)}, st)) {
      return;
    }
    (void)Publish(DoneEvent{}, st);
  }

  // Returns false only when a stop was requested.
  bool WaitReadable(const std::stop_token &st) {
    struct pollfd pfd {
      reader_.Get(), POLLIN, 0
    };
    for (;;) {
      if (PTYRUN_UNLIKELY(st.stop_requested())) {
        return false;
      }
      int rc = ::poll(&pfd, 1, kPollTimeoutMs);
      if (rc > 0) {
        return true;
      }
      if (rc < 0 && errno != EINTR) {
        // let read() surface the error
        return true;
      }
    }
  }

  // A full queue is waited out; output is never dropped.
  bool Publish(const ReaderEvent &ev, const std::stop_token &st) {
    while (!queue_->push(ev)) {
      if (PTYRUN_UNLIKELY(st.stop_requested())) {
        return false;
      }
      std::this_thread::yield();
    }
    return true;
  }

  io::UniqueFd reader_;
  std::shared_ptr<ReaderQueue> queue_;
  std::jthread worker_;
};

} // namespace pty
