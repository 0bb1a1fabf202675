#pragma once

#include <fcntl.h>
#include <unistd.h>
#include <utility>

// Owning file descriptor. Closes on destruction; movable, not copyable.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;
  UniqueFd(UniqueFd &&o) noexcept : fd_(std::exchange(o.fd_, -1)) {}
  UniqueFd &operator=(UniqueFd &&o) noexcept {
    if (this != &o) {
      Reset(std::exchange(o.fd_, -1));
    }
    return *this;
  }
  ~UniqueFd() { Reset(); }

  int Get() const { return fd_; }
  bool Valid() const { return fd_ >= 0; }
  explicit operator bool() const { return Valid(); }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

inline bool SetNonBlocking(int fd, bool on = true) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

inline bool SetCloseOnExec(int fd) {
  int flags = ::fcntl(fd, F_GETFD, 0);
  return flags >= 0 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

// Self-pipe used to wake a poll() from another thread.
class InterruptPipe {
public:
  InterruptPipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) == 0) {
      read_.Reset(fds[0]);
      write_.Reset(fds[1]);
    }
  }

  bool Valid() const { return read_.Valid() && write_.Valid(); }
  int ReadFd() const { return read_.Get(); }

  void Notify() {
    char c = 1;
    (void)!::write(write_.Get(), &c, 1);
  }

  void Clear() {
    char buf[64];
    while (::read(read_.Get(), buf, sizeof(buf)) > 0) {
    }
  }

private:
  UniqueFd read_;
  UniqueFd write_;
};
