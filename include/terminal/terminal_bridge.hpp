#pragma once

#include "core/error.hpp"
#include "core/event.hpp"
#include "terminal/byte_stream.hpp"
#include "terminal/child_process.hpp"
#include "terminal/line_buffer.hpp"
#include "terminal/unique_fd.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <pty.h>
#include <string>
#include <termios.h>
#include <utility>
#include <vector>

// TerminalBridge
// Threading model:
// - Read side (ReadLines/Submit/FlushPartial) is driven by the single thread
//   executing a command on the owning transport
// - Interrupt() and Close() may be called from any thread; they wake a
//   blocked ReadLines which then reports the stream as closed
// - Owns the stream and, for pty-backed bridges, the child running on the
//   slave side
class TerminalBridge {
public:
  using Clock = std::chrono::steady_clock;

  explicit TerminalBridge(std::unique_ptr<IByteStream> stream,
                          std::optional<ChildProcess> child = std::nullopt)
      : stream_(std::move(stream)), child_(std::move(child)) {}

  // Opens a pty pair in raw mode and runs argv on the slave side.
  static Result<std::unique_ptr<TerminalBridge>>
  SpawnOnTerminal(const std::vector<std::string> &argv) {
    int master = -1;
    int slave = -1;
    struct winsize ws {};
    ws.ws_row = 50;
    ws.ws_col = 250;
    if (::openpty(&master, &slave, nullptr, nullptr, &ws) != 0) {
      return MakeError(ErrorKind::kConnection,
                       std::string("openpty: ") + std::strerror(errno));
    }
    UniqueFd masterFd(master);
    UniqueFd slaveFd(slave);
    SetCloseOnExec(master);
    termios tio{};
    if (::tcgetattr(slave, &tio) == 0) {
      ::cfmakeraw(&tio);
      ::tcsetattr(slave, TCSANOW, &tio);
    }
    auto child = ChildProcess::SpawnOnTerminal(argv, slave);
    if (!child) {
      return std::unexpected(child.error());
    }
    slaveFd.Reset();
    return std::make_unique<TerminalBridge>(
        std::make_unique<FdStream>(std::move(masterFd), true),
        std::move(*child));
  }

  // Socket-backed remote shell.
  static std::unique_ptr<TerminalBridge> AttachSocket(UniqueFd sock) {
    return std::make_unique<TerminalBridge>(
        std::make_unique<FdStream>(std::move(sock), false));
  }

  // Reads one chunk (waiting at most wait) and reports each completed line.
  // Returns the number of lines delivered, or kConnection once the stream is
  // closed.
  template <typename Fn>
  Result<std::size_t> ReadLines(std::chrono::milliseconds wait, Fn &&onLine) {
    auto chunk = stream_->Read(wait);
    if (!chunk) {
      return std::unexpected(chunk.error());
    }
    if (!chunk->has_value()) {
      return std::size_t{0};
    }
    std::size_t n = 0;
    const OutputSource src = (*chunk)->source;
    BufferFor(src).Feed((*chunk)->data, [&](std::string line) {
      ++n;
      onLine(src, std::move(line));
    });
    return n;
  }

  // Drops stale input, writes data and drains it to the far side.
  Status Submit(std::string_view data, Clock::time_point deadline) {
    stream_->DiscardPending();
    stdout_.Clear();
    stderr_.Clear();
    return stream_->Write(data, deadline);
  }

  // Unterminated trailing output, returned as final lines.
  std::vector<std::pair<OutputSource, std::string>> FlushPartial() {
    std::vector<std::pair<OutputSource, std::string>> out;
    if (auto l = stdout_.Flush()) {
      out.emplace_back(OutputSource::kStdout, std::move(*l));
    }
    if (auto l = stderr_.Flush()) {
      out.emplace_back(OutputSource::kStderr, std::move(*l));
    }
    return out;
  }

  void Interrupt() noexcept { stream_->Interrupt(); }

  bool Closed() const { return stream_->Interrupted(); }

  std::size_t MaxCommandLength() const { return stream_->MaxCommandLength(); }

  // Liveness of the process on the slave side; socket bridges report true.
  bool ChildRunning() {
    if (!child_) {
      return true;
    }
    return child_->Running();
  }

  void Close(std::chrono::milliseconds grace) noexcept {
    stream_->Interrupt();
    if (child_) {
      child_->Terminate(grace);
    }
  }

  ~TerminalBridge() { Close(std::chrono::milliseconds(500)); }

private:
  LineBuffer &BufferFor(OutputSource s) {
    return s == OutputSource::kStdout ? stdout_ : stderr_;
  }

  std::unique_ptr<IByteStream> stream_;
  std::optional<ChildProcess> child_;
  LineBuffer stdout_;
  LineBuffer stderr_;
};
