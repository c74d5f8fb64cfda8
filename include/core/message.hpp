#pragma once

#include <boost/lockfree/spsc_queue.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace pty {

// Control messages: session handle -> run loop
struct InputMessage {
  std::string data;
};

struct ResizeMessage {
  std::uint16_t cols;
  std::uint16_t rows;
};

struct KillMessage {};

using ControlMessage = std::variant<InputMessage, ResizeMessage, KillMessage>;

// Reader events: reader worker -> run loop
struct ChunkEvent {
  std::string text;
};

struct DoneEvent {};

using ReaderEvent = std::variant<ChunkEvent, DoneEvent>;

static constexpr std::size_t kReaderQueueCapacity = 1024;

using ReaderQueue =
    boost::lockfree::spsc_queue<ReaderEvent,
                                boost::lockfree::capacity<kReaderQueueCapacity>>;

} // namespace pty
