#pragma once

#include "logging/logger.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <utility>

namespace output {

struct SinkOptions {
  // Bytes of output kept in memory; older whole chunks are dropped first
  std::size_t max_buffer = 50 * 1024;
  // Total output size beyond which the full stream goes to a transcript file
  std::size_t spill_threshold = 50 * 1024;
  // Where transcript files are created
  std::string transcript_dir = "/tmp";
  // Called for every chunk, before buffering
  std::function<void(const std::string &)> on_chunk;
};

struct OutputSummary {
  std::string output;
  bool truncated = false;
  std::size_t total_bytes = 0;
  std::size_t total_lines = 0;
  std::optional<std::string> transcript_path;
};

// OutputSink — caller-side consumer of a session's chunk stream.
// Single-threaded: Push() is called from the session's delivery strand and
// Dump() after the run's future is ready, which orders it after the last
// Push().
class OutputSink {
public:
  explicit OutputSink(SinkOptions opt) : opt_(std::move(opt)) {}
  ~OutputSink() { Close(); }

  OutputSink(const OutputSink &) = delete;
  OutputSink &operator=(const OutputSink &) = delete;

  void Push(const std::string &text) {
    if (text.empty()) {
      return;
    }
    total_bytes_ += text.size();
    total_lines_ += static_cast<std::size_t>(
        std::count(text.begin(), text.end(), '\n'));

    if (total_bytes_ > opt_.spill_threshold && !spill_attempted_) {
      OpenTranscript();
    }
    if (transcript_) {
      transcript_->Append(text);
    }

    chunks_.push_back(text);
    buffered_ += text.size();
    while (buffered_ > opt_.max_buffer && chunks_.size() > 1) {
      buffered_ -= chunks_.front().size();
      chunks_.pop_front();
      truncated_ = true;
    }

    if (opt_.on_chunk) {
      opt_.on_chunk(text);
    }
  }

  // Flushes and closes the transcript, if one was opened.
  void Close() {
    if (transcript_) {
      transcript_->Join();
    }
  }

  // Buffered output plus an optional trailing annotation ("\n\n<note>").
  OutputSummary Dump(const std::string &annotation = {}) {
    Close();
    OutputSummary s;
    for (const auto &c : chunks_) {
      s.output += c;
    }
    if (!annotation.empty()) {
      s.output += "\n\n";
      s.output += annotation;
    }
    s.truncated = truncated_;
    s.total_bytes = total_bytes_;
    s.total_lines = total_lines_;
    if (transcript_) {
      s.transcript_path = transcript_->Path();
    }
    return s;
  }

private:
  // Starts the transcript with everything still buffered. Chunks dropped from
  // the buffer before the threshold was crossed cannot be recovered, which is
  // why max_buffer should not be below spill_threshold.
  void OpenTranscript() {
    spill_attempted_ = true;
    auto logger = std::make_unique<logging::TranscriptLogger>(NextPath());
    if (!logger->OpenOk()) {
      std::cerr << "[output_sink] cannot open transcript " << logger->Path()
                << "\n";
      return;
    }
    logger->Start();
    for (const auto &c : chunks_) {
      logger->Append(c);
    }
    transcript_ = std::move(logger);
  }

  std::string NextPath() const {
    static std::atomic<unsigned> seq{0};
    return opt_.transcript_dir + "/ptyrun_" + timeutil::TimestampForFile() +
           "_" + std::to_string(::getpid()) + "_" +
           std::to_string(seq.fetch_add(1, std::memory_order_relaxed)) +
           ".log";
  }

  SinkOptions opt_;
  std::deque<std::string> chunks_;
  std::size_t buffered_ = 0;
  std::size_t total_bytes_ = 0;
  std::size_t total_lines_ = 0;
  bool truncated_ = false;
  bool spill_attempted_ = false;
  std::unique_ptr<logging::TranscriptLogger> transcript_;
};

} // namespace output
