#pragma once

#include "sessions/shell_transport.hpp"
#include "sessions/ssh_ops.hpp"
#include "terminal/byte_stream.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <libssh2.h>
#include <map>
#include <memory>
#include <poll.h>
#include <string>
#include <sys/socket.h>

// SshChannelStream
// Non-blocking libssh2 shell channel presented as a byte stream. Only the
// executing thread touches libssh2; Interrupt() shuts the socket down and
// wakes the poll without calling into the library.
class SshChannelStream : public IByteStream {
public:
  SshChannelStream(LIBSSH2_SESSION *session, LIBSSH2_CHANNEL *channel, int sock)
      : session_(session), channel_(channel), sock_(sock) {}

  ~SshChannelStream() override {
    if (channel_ != nullptr) {
      libssh2_channel_free(channel_);
    }
  }

  Result<std::optional<Chunk>> Read(std::chrono::milliseconds wait) override {
    if (interrupted_.load(std::memory_order_acquire)) {
      return MakeError(ErrorKind::kConnection, "stream interrupted");
    }
    char buf[8192];
    ssize_t n = libssh2_channel_read(channel_, buf, sizeof(buf));
    if (n > 0) {
      return std::optional<Chunk>{
          Chunk{OutputSource::kStdout, std::string(buf, static_cast<std::size_t>(n))}};
    }
    if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
      return MakeError(ErrorKind::kConnection, sshops::LastError(session_));
    }
    n = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
    if (n > 0) {
      return std::optional<Chunk>{
          Chunk{OutputSource::kStderr, std::string(buf, static_cast<std::size_t>(n))}};
    }
    if (libssh2_channel_eof(channel_)) {
      return MakeError(ErrorKind::kConnection, "remote shell exited");
    }
    if (!WaitSocket(wait)) {
      return MakeError(ErrorKind::kConnection, "stream interrupted");
    }
    return std::optional<Chunk>{};
  }

  Status Write(std::string_view data,
               std::chrono::steady_clock::time_point deadline) override {
    std::size_t sent = 0;
    while (sent < data.size()) {
      if (interrupted_.load(std::memory_order_acquire)) {
        return MakeError(ErrorKind::kConnection, "stream interrupted");
      }
      ssize_t w = libssh2_channel_write(channel_, data.data() + sent,
                                        data.size() - sent);
      if (w == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) {
          return MakeError(ErrorKind::kTimeout, "channel write timed out");
        }
        (void)WaitSocket(std::chrono::milliseconds(50));
        continue;
      }
      if (w < 0) {
        return MakeError(ErrorKind::kConnection, sshops::LastError(session_));
      }
      sent += static_cast<std::size_t>(w);
    }
    return {};
  }

  void DiscardPending() override {
    char buf[4096];
    while (libssh2_channel_read(channel_, buf, sizeof(buf)) > 0) {
    }
    while (libssh2_channel_read_stderr(channel_, buf, sizeof(buf)) > 0) {
    }
  }

  void Interrupt() noexcept override {
    if (!interrupted_.exchange(true)) {
      intr_.Notify();
      ::shutdown(sock_, SHUT_RDWR);
    }
  }

  bool Interrupted() const override {
    return interrupted_.load(std::memory_order_acquire);
  }

  std::size_t MaxCommandLength() const override {
    return FdStream::kTerminalLineLimit;
  }

private:
  // False when woken by Interrupt().
  bool WaitSocket(std::chrono::milliseconds wait) {
    short events = 0;
    int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) {
      events |= POLLIN;
    }
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
      events |= POLLOUT;
    }
    if (events == 0) {
      events = POLLIN;
    }
    pollfd fds[2] = {{sock_, events, 0}, {intr_.ReadFd(), POLLIN, 0}};
    (void)::poll(fds, 2, static_cast<int>(wait.count()));
    return fds[1].revents == 0 && !interrupted_.load(std::memory_order_acquire);
  }

  LIBSSH2_SESSION *session_;
  LIBSSH2_CHANNEL *channel_;
  int sock_;
  InterruptPipe intr_;
  std::atomic<bool> interrupted_{false};
};

struct SshParams {
  std::string host;
  std::uint16_t port = 22;
  sshops::Credentials credentials;
};

// SshTransport
// Disconnected -> Connecting -> Connected -> (Executing)* -> Disconnected.
// Threading model:
// - Start() runs on the caller's thread: TCP connect under the connect
//   timeout, handshake and authentication in blocking mode with a libssh2
//   timeout, then the session switches to non-blocking for the shell
// - Stop() interrupts a running command through the socket and tears the
//   session down once the command lets go; if it does not within the join
//   bound, teardown is left to the destructor
class SshTransport : public ShellTransport {
public:
  SshTransport(std::string id, SshParams params, config::Timeouts timeouts,
               std::shared_ptr<logging::AuditTrail> audit = nullptr)
      : ShellTransport(std::move(id), timeouts, std::move(audit)),
        params_(std::move(params)) {
    state_.store(TransportState::kDisconnected);
  }

  ~SshTransport() override {
    TakeBridge().reset();
    FreeSession();
  }

  Status Start() override {
    if (!CompareSetState(TransportState::kDisconnected,
                         TransportState::kConnecting)) {
      return MakeError(ErrorKind::kConflict, "ssh session already started");
    }
    auto st = Connect();
    if (!st) {
      logging::Error("ssh", id_, "connect", st.error().message);
      TakeBridge().reset();
      FreeSession();
      SetState(TransportState::kDisconnected);
      return st;
    }
    SetState(TransportState::kConnected);
    // Probe the shell; also turns off terminal echo for later commands.
    auto probe = RunCommand("stty -echo 2>/dev/null; echo 'SSH_CONNECTION_TEST'",
                            timeouts_.ssh_probe);
    if (!probe || probe->stdout_text.find("SSH_CONNECTION_TEST") ==
                      std::string::npos) {
      std::string why = probe ? "unexpected probe output" : probe.error().message;
      logging::Error("ssh", id_, "probe", why);
      TakeBridge().reset();
      FreeSession();
      SetState(TransportState::kDisconnected);
      return MakeError(ErrorKind::kConnection, "connection probe failed: " + why);
    }
    audit_->Record("connected", params_.host + ":" +
                                     std::to_string(params_.port) + " " +
                                     fingerprint_);
    logging::Info("ssh", id_,
                  "connected to " + params_.host + ":" +
                      std::to_string(params_.port) + " hostkey " + fingerprint_);
    return {};
  }

  void Stop() noexcept override {
    auto prev = state_.exchange(TransportState::kTerminated);
    if (prev == TransportState::kTerminated) {
      return;
    }
    auto lk = InterruptAndWait();
    if (!lk.owns_lock()) {
      logging::Warn("ssh", id_,
                    "command did not return within join bound, deferring "
                    "teardown");
      return;
    }
    TakeBridge().reset();
    FreeSession();
    audit_->Record("stopped", "");
    audit_->Close();
  }

  TransportKind Kind() const override { return TransportKind::kSsh; }

  bool Alive() const override {
    auto s = State();
    return s != TransportState::kDisconnected &&
           s != TransportState::kTerminated;
  }

  std::chrono::milliseconds DefaultTimeout() const override {
    return timeouts_.ssh_command;
  }

  std::map<std::string, std::string> Describe() const override {
    return {{"target", params_.host},
            {"port", std::to_string(params_.port)},
            {"username", params_.credentials.username},
            {"host_key", fingerprint_}};
  }

private:
  Status Connect() {
    if (auto st = sshops::GlobalInit(); !st) {
      return st;
    }
    auto fd = sshops::ConnectTcp(params_.host, params_.port, timeouts_.connect);
    if (!fd) {
      return std::unexpected(fd.error());
    }
    sock_ = std::move(*fd);
    session_ = libssh2_session_init();
    if (session_ == nullptr) {
      return MakeError(ErrorKind::kConnection, "libssh2_session_init failed");
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_,
                                static_cast<long>(timeouts_.connect.count()));
    if (auto st = sshops::Handshake(session_, sock_.Get()); !st) {
      return st;
    }
    fingerprint_ = sshops::HostKeyFingerprint(session_);
    if (auto st = sshops::Authenticate(session_, params_.credentials); !st) {
      return st;
    }
    auto ch = sshops::OpenShell(session_);
    if (!ch) {
      return std::unexpected(ch.error());
    }
    libssh2_session_set_timeout(session_, 0);
    libssh2_session_set_blocking(session_, 0);
    InstallBridge(std::make_shared<TerminalBridge>(
        std::make_unique<SshChannelStream>(session_, *ch, sock_.Get())));
    return {};
  }

  void FreeSession() noexcept {
    if (session_ != nullptr) {
      libssh2_session_set_blocking(session_, 0);
      libssh2_session_disconnect(session_, "shellmux session closed");
      libssh2_session_free(session_);
      session_ = nullptr;
    }
    sock_.Reset();
  }

  SshParams params_;
  UniqueFd sock_;
  LIBSSH2_SESSION *session_ = nullptr;
  std::string fingerprint_;
};
