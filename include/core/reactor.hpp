#pragma once

#include <utility> // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns an io_context run by N std::jthread workers; session strands deliver
//   output chunks and final results there, in order, off the run-loop threads
// - Owns a thread_pool for blocking work: a RunLoop occupies one pool thread
//   for as long as its command runs, so the pool size bounds how many sessions
//   can run concurrently
// - Stop() waits for dispatched run loops, then for the handlers they queued
class Reactor {
public:
  explicit Reactor(std::size_t blockingThreads = 4)
      : blocking_(blockingThreads) {}

  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  net::io_context &GetIoContext() { return ioc_; }
  net::thread_pool &GetBlockingPool() { return blocking_; }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  // Handlers already queued (chunks, results posted by finished run loops)
  // still run: the workers return from run() once the queue is empty.
  void Stop() {
    blocking_.join();
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    if (threads_.empty()) {
      ioc_.restart();
      ioc_.poll();
    }
    for (auto &t : threads_) {
      t.join();
    }
    threads_.clear();
  }

  ~Reactor() { Stop(); }

private:
  net::io_context ioc_;
  net::thread_pool blocking_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
