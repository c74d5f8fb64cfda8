#pragma once

#include <cerrno>
#include <cstddef>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace io {

// UniqueFd — owning wrapper for a POSIX file descriptor; closes on destruction.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    if (this != &other) {
      Reset(std::exchange(other.fd_, -1));
    }
    return *this;
  }

  ~UniqueFd() { Reset(); }

  int Get() const { return fd_; }
  bool Valid() const { return fd_ != -1; }
  explicit operator bool() const { return Valid(); }

  void Reset(int fd = -1) {
    if (fd_ != -1) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

// Writes as much as the descriptor accepts right now without blocking on a
// non-blocking fd. Returns bytes written, or -1 with errno set on a hard error
// (EAGAIN is reported as 0 bytes written).
inline ssize_t WriteSome(int fd, const char *data, std::size_t len) {
  std::size_t written = 0;
  while (written < len) {
    ssize_t n = ::write(fd, data + written, len - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        break;
      }
      return -1;
    }
    written += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(written);
}

inline void WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::yield();
        continue;
      }
      break;
    }
    ssize_t consumed = n;
    while (consumed > 0 && cnt > 0) {
      if (consumed >= static_cast<ssize_t>(iov[0].iov_len)) {
        consumed -= static_cast<ssize_t>(iov[0].iov_len);
        ++iov;
        --cnt;
      } else {
        iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + consumed;
        iov[0].iov_len -= static_cast<size_t>(consumed);
        consumed = 0;
      }
    }
    // skip zero-length entries left at the front
    while (cnt > 0 && iov[0].iov_len == 0) {
      ++iov;
      --cnt;
    }
  }
}

} // namespace io
