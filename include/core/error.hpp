#pragma once

#include <boost/system/error_code.hpp>
#include <expected>
#include <string>
#include <type_traits>

// namespace pty — error codes shared by the session handle and the run loop.
// Errors travel as boost::system::error_code inside std::expected, the same
// way the socket layer reports its stages.
namespace pty {

enum class errc {
  // control-send / handle state
  already_running = 1,
  not_running,
  session_gone,
  lock_poisoned,
  // setup
  pty_open_failed,
  spawn_failed,
  writer_failed,
  reader_failed,
  // run loop
  status_check_failed,
  wait_failed,
  run_failed,
};

class ErrorCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "ptyrun"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::already_running:
      return "PTY session already running";
    case errc::not_running:
      return "PTY session is not running";
    case errc::session_gone:
      return "PTY session is no longer available";
    case errc::lock_poisoned:
      return "PTY session lock poisoned";
    case errc::pty_open_failed:
      return "Failed to open PTY";
    case errc::spawn_failed:
      return "Failed to spawn PTY command";
    case errc::writer_failed:
      return "Failed to create PTY writer";
    case errc::reader_failed:
      return "Failed to create PTY reader";
    case errc::status_check_failed:
      return "Failed checking PTY status";
    case errc::wait_failed:
      return "Failed waiting PTY process";
    case errc::run_failed:
      return "PTY execution task failed";
    }
    return "unknown ptyrun error";
  }
};

inline const boost::system::error_category &GetErrorCategory() {
  static const ErrorCategory category;
  return category;
}

inline boost::system::error_code make_error_code(errc e) {
  return {static_cast<int>(e), GetErrorCategory()};
}

inline std::unexpected<boost::system::error_code> Fail(errc e) {
  return std::unexpected(make_error_code(e));
}

using Status = std::expected<void, boost::system::error_code>;

} // namespace pty

namespace boost::system {
template <> struct is_error_code_enum<pty::errc> : std::true_type {};
} // namespace boost::system
