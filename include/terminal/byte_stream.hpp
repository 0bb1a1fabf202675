#pragma once

#include "core/error.hpp"
#include "core/event.hpp"
#include "io/file_writer.hpp"
#include "terminal/unique_fd.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <poll.h>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

struct Chunk {
  OutputSource source;
  std::string data;
};

// Bidirectional byte stream underneath a terminal bridge: a pty master, an
// accepted socket or an SSH channel.
// Read/Write are called by the one thread executing a command; Interrupt and
// Close may be called from any thread to abort that wait.
class IByteStream {
public:
  virtual ~IByteStream() = default;

  // nullopt when nothing arrived within wait. kConnection error once the
  // peer is gone or the stream was interrupted.
  virtual Result<std::optional<Chunk>> Read(std::chrono::milliseconds wait) = 0;
  virtual Status Write(std::string_view data,
                       std::chrono::steady_clock::time_point deadline) = 0;
  // Drops whatever is already buffered for reading.
  virtual void DiscardPending() = 0;
  virtual void Interrupt() noexcept = 0;
  virtual bool Interrupted() const = 0;
  // Longest single command line the far side accepts.
  virtual std::size_t MaxCommandLength() const = 0;
};

// FdStream
// - Wraps one non-blocking descriptor plus a self-pipe so Interrupt() can
//   wake a poll() running on another thread
// - For a pty master, writes are followed by tcdrain()
class FdStream : public IByteStream {
public:
  // Canonical-mode line limit of a Linux tty is 4095 bytes; the bridge puts
  // the terminal in raw mode but the far end may not.
  static constexpr std::size_t kTerminalLineLimit = 4000;
  static constexpr std::size_t kSocketLineLimit = 64 * 1024;

  FdStream(UniqueFd fd, bool isTerminal)
      : fd_(std::move(fd)), terminal_(isTerminal) {
    SetNonBlocking(fd_.Get());
  }

  Result<std::optional<Chunk>> Read(std::chrono::milliseconds wait) override {
    if (interrupted_.load(std::memory_order_acquire)) {
      return MakeError(ErrorKind::kConnection, "stream interrupted");
    }
    pollfd fds[2] = {{fd_.Get(), POLLIN, 0}, {intr_.ReadFd(), POLLIN, 0}};
    int rc = ::poll(fds, 2, static_cast<int>(wait.count()));
    if (rc < 0) {
      if (errno == EINTR) {
        return std::optional<Chunk>{};
      }
      return MakeError(ErrorKind::kConnection,
                       std::string("poll: ") + std::strerror(errno));
    }
    if (fds[1].revents != 0 || interrupted_.load(std::memory_order_acquire)) {
      return MakeError(ErrorKind::kConnection, "stream interrupted");
    }
    if (rc == 0) {
      return std::optional<Chunk>{};
    }
    char buf[8192];
    ssize_t n = ::read(fd_.Get(), buf, sizeof(buf));
    if (n > 0) {
      return std::optional<Chunk>{
          Chunk{OutputSource::kStdout, std::string(buf, static_cast<std::size_t>(n))}};
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      return std::optional<Chunk>{};
    }
    // EOF on a socket, EIO on a pty master whose slave side is gone
    return MakeError(ErrorKind::kConnection, "connection closed by peer");
  }

  Status Write(std::string_view data,
               std::chrono::steady_clock::time_point deadline) override {
    if (interrupted_.load(std::memory_order_acquire)) {
      return MakeError(ErrorKind::kConnection, "stream interrupted");
    }
    if (!io::WriteAll(fd_.Get(), data.data(), data.size(), deadline)) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return MakeError(ErrorKind::kTimeout, "write timed out");
      }
      return MakeError(ErrorKind::kConnection,
                       std::string("write: ") + std::strerror(errno));
    }
    if (terminal_) {
      ::tcdrain(fd_.Get());
    }
    return {};
  }

  void DiscardPending() override {
    char buf[4096];
    while (::read(fd_.Get(), buf, sizeof(buf)) > 0) {
    }
  }

  void Interrupt() noexcept override {
    if (!interrupted_.exchange(true)) {
      intr_.Notify();
      if (!terminal_) {
        ::shutdown(fd_.Get(), SHUT_RDWR);
      }
    }
  }

  bool Interrupted() const override {
    return interrupted_.load(std::memory_order_acquire);
  }

  std::size_t MaxCommandLength() const override {
    return terminal_ ? kTerminalLineLimit : kSocketLineLimit;
  }

private:
  UniqueFd fd_;
  bool terminal_;
  InterruptPipe intr_;
  std::atomic<bool> interrupted_{false};
};
