#pragma once

#include "core/error.hpp"
#include "terminal/unique_fd.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <string>
#include <sys/ioctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

// ChildProcess
// - Owns one forked child that leads its own session and process group, so
//   signals reach everything it spawned
// - Destruction terminates and reaps the child if it is still running
class ChildProcess {
public:
  struct Pipes {
    UniqueFd out;
    UniqueFd err;
  };

  ChildProcess() = default;
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;
  ChildProcess(ChildProcess &&o) noexcept
      : pid_(std::exchange(o.pid_, -1)), status_(o.status_) {}
  ChildProcess &operator=(ChildProcess &&o) noexcept {
    if (this != &o) {
      Terminate(std::chrono::milliseconds(500));
      pid_ = std::exchange(o.pid_, -1);
      status_ = o.status_;
    }
    return *this;
  }
  ~ChildProcess() { Terminate(std::chrono::milliseconds(500)); }

  // Runs argv with the pty slave as controlling terminal and stdio.
  static Result<ChildProcess> SpawnOnTerminal(const std::vector<std::string> &argv,
                                              int slaveFd) {
    auto args = MakeArgv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
      return MakeError(ErrorKind::kConnection,
                       std::string("fork: ") + std::strerror(errno));
    }
    if (pid == 0) {
      ::setsid();
      ::ioctl(slaveFd, TIOCSCTTY, 0);
      ::dup2(slaveFd, STDIN_FILENO);
      ::dup2(slaveFd, STDOUT_FILENO);
      ::dup2(slaveFd, STDERR_FILENO);
      if (slaveFd > STDERR_FILENO) {
        ::close(slaveFd);
      }
      ResetSignals();
      ::execvp(args[0], args.data());
      ::_exit(127);
    }
    ChildProcess c;
    c.pid_ = pid;
    return c;
  }

  // Runs argv with stdin on /dev/null and separate stdout/stderr pipes.
  static Result<ChildProcess> SpawnWithPipes(const std::vector<std::string> &argv,
                                             Pipes &pipes) {
    int out[2];
    int err[2];
    if (::pipe2(out, O_CLOEXEC) != 0) {
      return MakeError(ErrorKind::kConnection,
                       std::string("pipe: ") + std::strerror(errno));
    }
    if (::pipe2(err, O_CLOEXEC) != 0) {
      ::close(out[0]);
      ::close(out[1]);
      return MakeError(ErrorKind::kConnection,
                       std::string("pipe: ") + std::strerror(errno));
    }
    auto args = MakeArgv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
      int e = errno;
      for (int fd : {out[0], out[1], err[0], err[1]}) {
        ::close(fd);
      }
      return MakeError(ErrorKind::kConnection,
                       std::string("fork: ") + std::strerror(e));
    }
    if (pid == 0) {
      ::setsid();
      int devnull = ::open("/dev/null", O_RDONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
      }
      ::dup2(out[1], STDOUT_FILENO);
      ::dup2(err[1], STDERR_FILENO);
      ResetSignals();
      ::execvp(args[0], args.data());
      ::_exit(127);
    }
    ::close(out[1]);
    ::close(err[1]);
    pipes.out.Reset(out[0]);
    pipes.err.Reset(err[0]);
    ChildProcess c;
    c.pid_ = pid;
    return c;
  }

  bool Running() {
    if (pid_ <= 0) {
      return false;
    }
    return !Reap(WNOHANG);
  }

  // Waits up to timeout for exit. Returns the exit code (128+signal for a
  // signalled child) or nullopt if it is still running.
  std::optional<int> WaitFor(std::chrono::milliseconds timeout) {
    if (pid_ <= 0) {
      return ExitCode();
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
      if (Reap(WNOHANG)) {
        return ExitCode();
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        return std::nullopt;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  // SIGTERM to the process group, bounded wait, then SIGKILL.
  void Terminate(std::chrono::milliseconds grace) noexcept {
    if (pid_ <= 0) {
      return;
    }
    if (Reap(WNOHANG)) {
      return;
    }
    ::kill(-pid_, SIGTERM);
    ::kill(pid_, SIGTERM);
    if (WaitFor(grace)) {
      return;
    }
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    (void)Reap(0);
  }

  std::optional<int> ExitCode() const {
    if (!status_) {
      return std::nullopt;
    }
    if (WIFEXITED(*status_)) {
      return WEXITSTATUS(*status_);
    }
    if (WIFSIGNALED(*status_)) {
      return 128 + WTERMSIG(*status_);
    }
    return -1;
  }

private:
  static std::vector<char *> MakeArgv(const std::vector<std::string> &argv) {
    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &a : argv) {
      args.push_back(const_cast<char *>(a.c_str()));
    }
    args.push_back(nullptr);
    return args;
  }

  static void ResetSignals() {
    ::signal(SIGPIPE, SIG_DFL);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
  }

  // True once the child has been collected.
  bool Reap(int flags) {
    if (pid_ <= 0) {
      return true;
    }
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &status, flags);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
      status_ = status;
      pid_ = -1;
      return true;
    }
    if (r < 0) {
      // ECHILD: collected elsewhere, exit status unknown
      status_ = 255 << 8;
      pid_ = -1;
      return true;
    }
    return false;
  }

  pid_t pid_ = -1;
  std::optional<int> status_;
};
