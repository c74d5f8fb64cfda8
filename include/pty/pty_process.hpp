#pragma once

#include "core/config.hpp"
#include "core/session_config.hpp"
#include "io/file_writer.hpp"
#include <boost/system/error_code.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <expected>
#include <fcntl.h>
#include <optional>
#include <stdlib.h>
#include <signal.h>
#include <string>
#include <sys/ioctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#include <utility>
#include <vector>

extern char **environ;

// PTY and child-process primitives (Linux).
// Threading model:
// - Everything here is driven from the run loop; the reader worker only ever
//   sees a duplicated master descriptor
// - Errors carry the OS errno as a system error_code; callers decide how to
//   log and classify them
namespace pty {

using boost::system::error_code;

inline error_code LastOsError() {
  return error_code(errno, boost::system::system_category());
}

inline bool SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL);
  return flags != -1 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

// A second handle on the same open file description. Close-on-exec so a
// concurrent spawn in another session never inherits it.
inline std::expected<io::UniqueFd, error_code> DupCloexec(int fd) {
  const int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
  if (copy < 0) {
    return std::unexpected(LastOsError());
  }
  return io::UniqueFd(copy);
}

inline struct winsize ToWinsize(TerminalSize size) {
  struct winsize ws;
  std::memset(&ws, 0, sizeof(ws));
  ws.ws_col = size.cols;
  ws.ws_row = size.rows;
  return ws;
}

struct PtyPair {
  io::UniqueFd master;
  io::UniqueFd slave;
};

// Applies a new window size; the kernel raises SIGWINCH in the foreground
// process group.
inline bool ResizePty(int master, TerminalSize size) {
  struct winsize ws = ToWinsize(size);
  return ::ioctl(master, TIOCSWINSZ, &ws) == 0;
}

// Both ends are opened close-on-exec, so no fork in another session can
// inherit them; the child's stdio are dup2 copies, which do not inherit the
// flag.
inline std::expected<PtyPair, error_code> OpenPty(TerminalSize size) {
  PtyPair pair;
  pair.master.Reset(::posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC));
  if (!pair.master.Valid()) {
    return std::unexpected(LastOsError());
  }
  if (::grantpt(pair.master.Get()) != 0 || ::unlockpt(pair.master.Get()) != 0) {
    return std::unexpected(LastOsError());
  }
  char name[128];
  if (int rc = ::ptsname_r(pair.master.Get(), name, sizeof(name)); rc != 0) {
    return std::unexpected(error_code(rc, boost::system::system_category()));
  }
  pair.slave.Reset(::open(name, O_RDWR | O_NOCTTY | O_CLOEXEC));
  if (!pair.slave.Valid()) {
    return std::unexpected(LastOsError());
  }
  if (!ResizePty(pair.master.Get(), size)) {
    return std::unexpected(LastOsError());
  }
  return pair;
}

inline std::optional<TerminalSize> QueryPtySize(int fd) {
  struct winsize ws;
  if (::ioctl(fd, TIOCGWINSZ, &ws) != 0) {
    return std::nullopt;
  }
  return TerminalSize{.cols = ws.ws_col, .rows = ws.ws_row};
}

// Translates a waitpid status the way shells report it: the exit code, or 128
// plus the signal number for a signalled child.
inline int ExitCodeFromStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return 1;
}

// Everything the child needs, prepared before fork so the child only makes
// async-signal-safe calls.
struct SpawnRequest {
  std::vector<std::string> argv;
  std::vector<std::string> envp;
  std::optional<std::string> cwd;

  // `<shell> -lc <command>` over the parent's environment with the overrides
  // merged in and TERM defaulted from the engine config.
  static SpawnRequest ForShellCommand(const SessionConfig &cfg,
                                      const EngineConfig &engine) {
    SpawnRequest req;
    req.argv = {engine.shell, "-lc", cfg.command};
    req.cwd = cfg.cwd;

    EnvOverrides merged;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
      std::string entry(*e);
      const auto eq = entry.find('=');
      if (eq == std::string::npos) {
        continue;
      }
      merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    merged["TERM"] = engine.term;
    if (cfg.env.has_value()) {
      for (const auto &[key, value] : *cfg.env) {
        merged[key] = value;
      }
    }
    req.envp.reserve(merged.size());
    for (const auto &[key, value] : merged) {
      req.envp.push_back(key + "=" + value);
    }
    return req;
  }
};

// ChildProcess — a spawned session leader attached to a PTY slave.
// The child calls setsid(), so its pid is also its process-group id and Kill()
// reaches the whole pipeline the shell started, not only the shell.
class ChildProcess {
public:
  ChildProcess() = default;
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  ChildProcess(ChildProcess &&other) noexcept
      : pid_(std::exchange(other.pid_, -1)),
        status_(std::exchange(other.status_, std::nullopt)) {}

  ChildProcess &operator=(ChildProcess &&other) noexcept {
    if (this != &other) {
      Reap();
      pid_ = std::exchange(other.pid_, -1);
      status_ = std::exchange(other.status_, std::nullopt);
    }
    return *this;
  }

  ~ChildProcess() { Reap(); }

  static std::expected<ChildProcess, error_code>
  Spawn(const SpawnRequest &req, int slave) {
    std::vector<char *> argv;
    for (const auto &a : req.argv) {
      argv.push_back(const_cast<char *>(a.c_str()));
    }
    argv.push_back(nullptr);
    std::vector<char *> envp;
    for (const auto &e : req.envp) {
      envp.push_back(const_cast<char *>(e.c_str()));
    }
    envp.push_back(nullptr);

    // exec failures come back through a close-on-exec pipe: EOF means exec
    // succeeded, an int means the child's errno.
    int errpipe[2];
    if (::pipe2(errpipe, O_CLOEXEC) != 0) {
      return std::unexpected(LastOsError());
    }
    io::UniqueFd err_read(errpipe[0]);
    io::UniqueFd err_write(errpipe[1]);

    const char *cwd = req.cwd.has_value() ? req.cwd->c_str() : nullptr;
    const pid_t pid = ::fork();
    if (pid < 0) {
      return std::unexpected(LastOsError());
    }
    if (pid == 0) {
      RunChild(slave, cwd, argv.data(), envp.data(), err_write.Get());
    }

    ChildProcess child;
    child.pid_ = pid;
    err_write.Reset();

    int child_errno = 0;
    ssize_t n = 0;
    do {
      n = ::read(err_read.Get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
      // Child is already on its way out; collect it before reporting.
      (void)child.Wait();
      return std::unexpected(
          error_code(child_errno, boost::system::system_category()));
    }
    return child;
  }

  pid_t Pid() const { return pid_; }
  bool Exited() const { return status_.has_value(); }
  std::optional<int> ExitCode() const { return status_; }

  // Non-blocking status poll. nullopt while the child is still running.
  std::expected<std::optional<int>, error_code> TryWait() {
    if (status_.has_value()) {
      return status_;
    }
    int status = 0;
    pid_t r = 0;
    do {
      r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
      return std::unexpected(LastOsError());
    }
    if (r == 0) {
      return std::optional<int>{};
    }
    status_ = ExitCodeFromStatus(status);
    return status_;
  }

  std::expected<int, error_code> Wait() {
    if (status_.has_value()) {
      return *status_;
    }
    int status = 0;
    pid_t r = 0;
    do {
      r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
      return std::unexpected(LastOsError());
    }
    status_ = ExitCodeFromStatus(status);
    return *status_;
  }

  // Best-effort SIGKILL to the child's process group, and to the child itself
  // while it has not been reaped. Failures (already gone) are ignored.
  void Kill() {
    if (pid_ <= 0) {
      return;
    }
    (void)::kill(-pid_, SIGKILL);
    if (!status_.has_value()) {
      (void)::kill(pid_, SIGKILL);
    }
  }

private:
  [[noreturn]] static void RunChild(int slave, const char *cwd,
                                    char *const *argv, char *const *envp,
                                    int errfd) {
    sigset_t none;
    sigemptyset(&none);
    (void)::sigprocmask(SIG_SETMASK, &none, nullptr);
    for (int sig : {SIGPIPE, SIGINT, SIGQUIT, SIGTERM, SIGHUP, SIGCHLD}) {
      (void)::signal(sig, SIG_DFL);
    }

    if (::setsid() < 0 || ::ioctl(slave, TIOCSCTTY, 0) != 0 ||
        ::dup2(slave, STDIN_FILENO) < 0 || ::dup2(slave, STDOUT_FILENO) < 0 ||
        ::dup2(slave, STDERR_FILENO) < 0) {
      ReportAndExit(errfd);
    }
    if (cwd != nullptr && ::chdir(cwd) != 0) {
      ReportAndExit(errfd);
    }
    ::execvpe(argv[0], argv, envp);
    ReportAndExit(errfd);
  }

  [[noreturn]] static void ReportAndExit(int errfd) {
    const int e = errno;
    (void)!::write(errfd, &e, sizeof(e));
    ::_exit(127);
  }

  // Destruction path only: a child that outlives its owner is killed and
  // collected so it never lingers as a zombie.
  void Reap() {
    if (pid_ > 0 && !status_.has_value()) {
      Kill();
      (void)Wait();
    }
    pid_ = -1;
  }

  pid_t pid_ = -1;
  std::optional<int> status_;
};

} // namespace pty
