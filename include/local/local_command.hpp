#pragma once

#include "core/error.hpp"
#include "core/event.hpp"
#include "core/event_channel.hpp"
#include "terminal/child_process.hpp"
#include "terminal/line_buffer.hpp"
#include "terminal/unique_fd.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace local {

struct RunOptions {
  std::chrono::milliseconds timeout = std::chrono::minutes(5);
  // SIGTERM to SIGKILL grace period
  std::chrono::milliseconds grace = std::chrono::seconds(5);
  // Kill the command if it has printed nothing after this long.
  std::optional<std::chrono::milliseconds> blocking_timeout;
};

// Runs command under /bin/sh -c on the calling thread, streaming stdout and
// stderr lines to sink. A timeout kills the process group and reports a
// timed-out result carrying the partial output; a silent command hitting the
// blocking timeout is reported as kTimeout.
inline Result<CommandResult> RunLocalCommand(const std::string &command,
                                             const RunOptions &opt,
                                             EventSink &sink) {
  using Clock = std::chrono::steady_clock;
  ChildProcess::Pipes pipes;
  auto child = ChildProcess::SpawnWithPipes({"/bin/sh", "-c", command}, pipes);
  if (!child) {
    return std::unexpected(child.error());
  }
  SetNonBlocking(pipes.out.Get());
  SetNonBlocking(pipes.err.Get());

  CollectingSink collect(sink);
  LineBuffer outBuf;
  LineBuffer errBuf;
  bool anyOutput = false;
  const auto start = Clock::now();
  const auto deadline = start + opt.timeout;

  auto drain = [&](UniqueFd &fd, LineBuffer &buf, OutputSource src) {
    char chunk[8192];
    for (;;) {
      ssize_t n = ::read(fd.Get(), chunk, sizeof(chunk));
      if (n > 0) {
        anyOutput = true;
        buf.Feed(std::string_view(chunk, static_cast<std::size_t>(n)),
                 [&](std::string line) {
                   collect.Emit(OutputEvent{src, std::move(line)});
                 });
        continue;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
      }
      fd.Reset();
      return;
    }
  };
  auto flush = [&] {
    if (auto l = outBuf.Flush()) {
      collect.Emit(OutputEvent{OutputSource::kStdout, std::move(*l)});
    }
    if (auto l = errBuf.Flush()) {
      collect.Emit(OutputEvent{OutputSource::kStderr, std::move(*l)});
    }
  };

  while (pipes.out.Valid() || pipes.err.Valid()) {
    const auto now = Clock::now();
    if (now >= deadline) {
      child->Terminate(opt.grace);
      flush();
      CommandResult r = std::move(collect.Result());
      r.exit_code = -1;
      r.timed_out = true;
      r.partial_ok = true;
      return r;
    }
    if (opt.blocking_timeout && !anyOutput &&
        now - start >= *opt.blocking_timeout) {
      child->Terminate(opt.grace);
      return MakeError(
          ErrorKind::kTimeout,
          "no output after " +
              std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                 *opt.blocking_timeout)
                                 .count()) +
              "s; the command looks interactive or blocking, run it through a "
              "reverse shell session instead");
    }
    if (sink.Cancelled()) {
      child->Terminate(opt.grace);
      return MakeError(ErrorKind::kConnection, "stream consumer disconnected");
    }
    pollfd fds[2] = {{pipes.out.Get(), POLLIN, 0}, {pipes.err.Get(), POLLIN, 0}};
    int rc = ::poll(fds, 2, 200);
    if (rc < 0 && errno != EINTR) {
      child->Terminate(opt.grace);
      return MakeError(ErrorKind::kConnection,
                       std::string("poll: ") + std::strerror(errno));
    }
    if (rc <= 0) {
      collect.Idle();
      continue;
    }
    if (fds[0].revents != 0) {
      drain(pipes.out, outBuf, OutputSource::kStdout);
    }
    if (fds[1].revents != 0) {
      drain(pipes.err, errBuf, OutputSource::kStderr);
    }
  }
  flush();

  // Both pipes closed; the process is exiting or detached its own children.
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - Clock::now());
  auto code = child->WaitFor(std::max(remaining, std::chrono::milliseconds(0)));
  CommandResult r = std::move(collect.Result());
  if (!code) {
    child->Terminate(opt.grace);
    r.exit_code = -1;
    r.timed_out = true;
    r.partial_ok = true;
    return r;
  }
  r.exit_code = *code;
  return r;
}

} // namespace local
