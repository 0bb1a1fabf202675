#pragma once

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <poll.h>
#include <sys/uio.h>
#include <unistd.h>

namespace io {

// Waits until fd is writable or the deadline passes.
inline bool WaitWritable(int fd, std::chrono::steady_clock::time_point deadline) {
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      return false;
    }
    pollfd p{fd, POLLOUT, 0};
    int rc = ::poll(&p, 1, static_cast<int>(left.count()));
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc <= 0) {
      return false;
    }
    return (p.revents & (POLLERR | POLLNVAL)) == 0;
  }
}

// Writes the whole buffer; non-blocking descriptors are waited on with poll
// until the deadline. Returns false on error or when the deadline passes.
inline bool WriteAll(int fd, const char *data, std::size_t len,
                     std::chrono::steady_clock::time_point deadline =
                         std::chrono::steady_clock::time_point::max()) {
  const char *p = data;
  std::size_t remaining = len;
  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (!WaitWritable(fd, deadline)) {
          return false;
        }
        continue;
      }
      return false;
    }
    p += static_cast<std::size_t>(n);
    remaining -= static_cast<std::size_t>(n);
  }
  return true;
}

inline bool WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (!WaitWritable(fd, std::chrono::steady_clock::now() +
                                  std::chrono::seconds(1))) {
          return false;
        }
        continue;
      }
      return false;
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
  }
  return true;
}

} // namespace io
