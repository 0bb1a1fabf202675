#pragma once

#include "core/worker_pool.hpp"
#include "local/local_command.hpp"
#include "net/backoff.hpp"
#include "sessions/shell_transport.hpp"
#include "util/thread.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace net = boost::asio;
using tcp = net::ip::tcp;

enum class ListenerType {
  // in-process acceptor
  kNative,
  // nc -nvlp <port> on a pty
  kNetcat,
};

inline std::string_view ListenerTypeName(ListenerType t) {
  return t == ListenerType::kNative ? "native" : "netcat";
}

inline std::optional<ListenerType> ParseListenerType(std::string_view s) {
  if (s.empty() || boost::algorithm::iequals(s, "native")) {
    return ListenerType::kNative;
  }
  if (boost::algorithm::iequals(s, "netcat") ||
      boost::algorithm::iequals(s, "nc")) {
    return ListenerType::kNetcat;
  }
  return std::nullopt;
}

struct ListenerParams {
  std::string bind_address = "0.0.0.0";
  // 0 binds an ephemeral port; BoundPort() reports it
  std::uint16_t port = 0;
  ListenerType type = ListenerType::kNative;
};

// ListenerTransport
// Initialized -> Listening -> Connected -> Executing <-> Connected ->
// Terminated, with Listening -> Triggering -> Listening|Connected while a
// trigger runs.
// Threading model:
// - Start() binds on the caller's thread and returns once bound
// - A dedicated watcher thread waits for the inbound connection in 200 ms
//   slices, honouring its stop token, then attaches a bridge to the peer
// - Each trigger runs on its own pool thread holding only a weak reference;
//   the state stays Triggering until the last overlapping trigger returns
// - Stop() is valid in every state; it joins the watcher with a bounded wait
class ListenerTransport
    : public ShellTransport,
      public std::enable_shared_from_this<ListenerTransport> {
public:
  ListenerTransport(std::string id, ListenerParams params, WorkerPool &pool,
                    config::Timeouts timeouts,
                    std::shared_ptr<logging::AuditTrail> audit = nullptr)
      : ShellTransport(std::move(id), timeouts, std::move(audit)),
        params_(std::move(params)), pool_(pool), acceptor_(ioc_) {}

  ~ListenerTransport() override { Stop(); }

  Status Start() override {
    if (!CompareSetState(TransportState::kInitialized,
                         TransportState::kListening)) {
      return MakeError(ErrorKind::kConflict, "listener already started");
    }
    auto st = params_.type == ListenerType::kNative ? BindNative()
                                                    : SpawnNetcat();
    if (!st) {
      logging::Error("listener", id_, "bind", st.error().message);
      SetState(TransportState::kTerminated);
      return st;
    }
    audit_->Record("listening", std::to_string(BoundPort()) + " " +
                                    std::string(ListenerTypeName(params_.type)));
    logging::Info("listener", id_,
                  "listening on " + params_.bind_address + ":" +
                      std::to_string(BoundPort()) + " (" +
                      std::string(ListenerTypeName(params_.type)) + ")");
    watcher_.Start([self = shared_from_this()](std::stop_token st) {
      if (self->params_.type == ListenerType::kNative) {
        self->WatchNative(st);
      } else {
        self->WatchNetcat(st);
      }
    });
    return {};
  }

  // Dispatches command to the worker pool and returns immediately. The
  // outcome is available later through LastTrigger().
  Result<TriggerAck> SendPayload(const std::string &command) override {
    auto s = State();
    if (s != TransportState::kListening && s != TransportState::kTriggering) {
      return MakeError(ErrorKind::kConflict,
                       std::string("listener is ") +
                           std::string(TransportStateName(s)) +
                           ", not waiting for a connection");
    }
    std::uint64_t seq = 0;
    {
      std::lock_guard lk(info_mu_);
      seq = ++trigger_seq_;
      ++triggers_in_flight_;
      (void)CompareSetState(TransportState::kListening,
                            TransportState::kTriggering);
      last_trigger_ = TriggerOutcome{};
      last_trigger_->command = command;
      last_trigger_->started_at = std::chrono::system_clock::now();
    }
    audit_->Record("trigger", command);
    std::weak_ptr<ListenerTransport> weak = weak_from_this();
    const local::RunOptions opt{.timeout = timeouts_.trigger,
                                .grace = std::chrono::milliseconds(500),
                                .blocking_timeout = std::nullopt};
    if (!pool_.Post(
            [weak, command, opt, seq] { RunTrigger(weak, command, opt, seq); })) {
      TriggerOutcome out;
      out.command = command;
      out.error = "no background task slot";
      FinishTrigger(seq, std::move(out));
      return MakeError(ErrorKind::kCapacity,
                       "too many background tasks, retry later");
    }
    return TriggerAck{true, "trigger dispatched, waiting for callback"};
  }

  std::optional<TriggerOutcome> LastTrigger() const override {
    std::lock_guard lk(info_mu_);
    return last_trigger_;
  }

  void Stop() noexcept override {
    auto prev = state_.exchange(TransportState::kTerminated);
    if (stopped_.exchange(true)) {
      return;
    }
    if (!watcher_.JoinFor(timeouts_.join)) {
      logging::Warn("listener", id_, "watcher did not exit within join bound");
    }
    auto lk = InterruptAndWait();
    if (!lk.owns_lock()) {
      logging::Warn("listener", id_,
                    "command did not return within join bound");
    }
    if (auto bridge = TakeBridge()) {
      for (auto &[src, line] : bridge->FlushPartial()) {
        audit_->Record("partial", line);
      }
      bridge->Close(std::chrono::seconds(3));
    }
    if (prev != TransportState::kTerminated) {
      audit_->Record("stopped", std::string(TransportStateName(prev)));
      logging::Info("listener", id_, "stopped");
    }
    audit_->Close();
  }

  TransportKind Kind() const override { return TransportKind::kReverseShell; }

  bool Alive() const override {
    auto s = State();
    return s != TransportState::kDisconnected &&
           s != TransportState::kTerminated;
  }

  std::chrono::milliseconds DefaultTimeout() const override {
    return timeouts_.shell_command;
  }

  std::uint16_t BoundPort() const {
    return bound_port_.load(std::memory_order_acquire);
  }

  std::map<std::string, std::string> Describe() const override {
    std::map<std::string, std::string> d{
        {"port", std::to_string(BoundPort())},
        {"listener_type", std::string(ListenerTypeName(params_.type))},
        {"bind_address", params_.bind_address}};
    std::lock_guard lk(info_mu_);
    if (!peer_.empty()) {
      d["peer"] = peer_;
    }
    if (last_trigger_) {
      d["last_trigger"] = last_trigger_->command;
      d["last_trigger_status"] =
          !last_trigger_->finished ? "running"
          : last_trigger_->success ? "succeeded"
                                   : "failed";
    }
    return d;
  }

private:
  Status BindNative() {
    boost::system::error_code ec;
    auto addr = net::ip::make_address(params_.bind_address, ec);
    if (ec) {
      return MakeError(ErrorKind::kInvalidArgument,
                       "bad bind address " + params_.bind_address);
    }
    tcp::endpoint ep(addr, params_.port);
    acceptor_.open(ep.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(ep, ec);
    }
    if (!ec) {
      acceptor_.listen(1, ec);
    }
    if (ec) {
      acceptor_.close(ec);
      return MakeError(ErrorKind::kConnection,
                       "bind " + std::to_string(params_.port) + ": " +
                           ec.message());
    }
    bound_port_.store(acceptor_.local_endpoint().port());
    return {};
  }

  Status SpawnNetcat() {
    if (params_.port == 0) {
      return MakeError(ErrorKind::kInvalidArgument,
                       "netcat listener needs an explicit port");
    }
    auto bridge = TerminalBridge::SpawnOnTerminal(
        {"nc", "-nvlp", std::to_string(params_.port)});
    if (!bridge) {
      return std::unexpected(bridge.error());
    }
    std::shared_ptr<TerminalBridge> shared = std::move(*bridge);
    // Banner wording differs between netcat flavours; a live process after
    // the bind window counts as bound.
    std::string seen;
    const auto deadline = std::chrono::steady_clock::now() + timeouts_.listener_bind;
    bool bound = false;
    while (!bound && std::chrono::steady_clock::now() < deadline) {
      auto r = shared->ReadLines(std::chrono::milliseconds(100),
                                 [&](OutputSource, std::string line) {
                                   seen += line + "\n";
                                   if (boost::algorithm::icontains(line,
                                                                   "listen")) {
                                     bound = true;
                                   }
                                 });
      if (!r || !shared->ChildRunning()) {
        shared->Close(std::chrono::milliseconds(500));
        return MakeError(ErrorKind::kConnection,
                         "netcat exited: " + (seen.empty() ? "no output" : seen));
      }
    }
    bound_port_.store(params_.port);
    InstallBridge(std::move(shared));
    return {};
  }

  void MarkConnected(const std::string &peer) {
    if (!CompareSetState(TransportState::kListening, TransportState::kConnected) &&
        !CompareSetState(TransportState::kTriggering,
                         TransportState::kConnected)) {
      return;
    }
    {
      std::lock_guard lk(info_mu_);
      peer_ = peer;
    }
    audit_->Record("connected", peer);
    logging::Info("listener", id_, "connection from " + peer);
  }

  void MarkConnectionTimeout() {
    auto s = State();
    if (s == TransportState::kListening || s == TransportState::kTriggering) {
      SetState(TransportState::kTerminated);
      audit_->Record("timeout", "no connection");
      logging::Warn("listener", id_,
                    "no connection within " +
                        std::to_string(std::chrono::duration_cast<
                                           std::chrono::seconds>(
                                           timeouts_.listener_connection)
                                           .count()) +
                        "s");
    }
  }

  void WatchNative(std::stop_token st) {
    const auto deadline =
        std::chrono::steady_clock::now() + timeouts_.listener_connection;
    retry::Backoff backoff;
    std::optional<tcp::socket> peer;
    bool pending = false;
    auto arm = [&] {
      pending = true;
      acceptor_.async_accept([&](const boost::system::error_code &ec, tcp::socket s) {
        pending = false;
        if (!ec) {
          peer.emplace(std::move(s));
          return;
        }
        if (ec != net::error::operation_aborted) {
          logging::Error("listener", id_, "accept", ec.message());
        }
      });
    };
    arm();
    while (!peer && !st.stop_requested() &&
           std::chrono::steady_clock::now() < deadline) {
      ioc_.run_for(std::chrono::milliseconds(200));
      if (ioc_.stopped()) {
        ioc_.restart();
      }
      if (!peer && !pending && !st.stop_requested()) {
        retry::WaitSync(backoff.Next(), st);
        arm();
      }
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
    ioc_.restart();
    ioc_.run();

    if (!peer) {
      if (!st.stop_requested()) {
        MarkConnectionTimeout();
      }
      return;
    }
    auto remote = peer->remote_endpoint(ec);
    std::string who = ec ? std::string("unknown")
                         : remote.address().to_string() + ":" +
                               std::to_string(remote.port());
    peer->set_option(net::socket_base::keep_alive(true), ec);
    UniqueFd fd(::dup(peer->native_handle()));
    peer->close(ec);
    if (!fd) {
      logging::Error("listener", id_, "dup", std::strerror(errno));
      SetState(TransportState::kDisconnected);
      return;
    }
    SetCloseOnExec(fd.Get());
    InstallBridge(TerminalBridge::AttachSocket(std::move(fd)));
    MarkConnected(who);
  }

  void WatchNetcat(std::stop_token st) {
    const auto deadline =
        std::chrono::steady_clock::now() + timeouts_.listener_connection;
    auto bridge = CurrentBridge();
    if (!bridge) {
      return;
    }
    std::string peer;
    while (peer.empty() && !st.stop_requested() &&
           std::chrono::steady_clock::now() < deadline) {
      auto r = bridge->ReadLines(std::chrono::milliseconds(200),
                                 [&](OutputSource, std::string line) {
                                   auto lower = boost::algorithm::to_lower_copy(line);
                                   if (peer.empty() &&
                                       (lower.find("connect") != std::string::npos ||
                                        lower.find("from") != std::string::npos)) {
                                     peer = line;
                                   }
                                 });
      if (!r || !bridge->ChildRunning()) {
        if (!st.stop_requested()) {
          logging::Warn("listener", id_, "netcat exited before a connection");
          SetState(TransportState::kTerminated);
        }
        return;
      }
    }
    if (peer.empty()) {
      if (!st.stop_requested()) {
        MarkConnectionTimeout();
      }
      return;
    }
    MarkConnected(peer);
    // nc forwards the peer; its exit means the peer is gone.
    while (!st.stop_requested()) {
      retry::WaitSync(200, st);
      if (!bridge->ChildRunning()) {
        SetState(TransportState::kDisconnected);
        audit_->Record("disconnected", "netcat exited");
        logging::Warn("listener", id_, "netcat exited, peer gone");
        return;
      }
    }
  }

  static void RunTrigger(std::weak_ptr<ListenerTransport> weak,
                         const std::string &command,
                         const local::RunOptions &opt, std::uint64_t seq) {
    if (auto self = weak.lock();
        !self || self->State() == TransportState::kTerminated) {
      return;
    }
    NullSink sink;
    auto r = local::RunLocalCommand(command, opt, sink);
    auto self = weak.lock();
    if (!self) {
      return;
    }
    TriggerOutcome out;
    out.command = command;
    if (r) {
      out.exit_code = r->exit_code;
      out.timed_out = r->timed_out;
      out.success = !r->timed_out && r->exit_code == 0;
      out.output = r->stdout_text + r->stderr_text;
      if (out.output.size() > 4096) {
        out.output.resize(4096);
      }
    } else {
      out.error = r.error().message;
    }
    self->audit_->Record("trigger_done",
                         out.success ? "ok"
                                     : (out.timed_out ? "timed out"
                                                      : "exit " + std::to_string(
                                                                      out.exit_code)));
    if (!out.success) {
      logging::Warn("listener", self->id_,
                    "trigger '" + command + "' failed: " +
                        (out.error.empty() ? "exit " + std::to_string(out.exit_code)
                                           : out.error));
    }
    self->FinishTrigger(seq, std::move(out));
  }

  // Back to Listening only once no trigger is running; last_trigger_ keeps
  // the outcome of the most recently dispatched trigger.
  void FinishTrigger(std::uint64_t seq, TriggerOutcome out) {
    std::lock_guard lk(info_mu_);
    if (--triggers_in_flight_ == 0) {
      (void)CompareSetState(TransportState::kTriggering,
                            TransportState::kListening);
    }
    if (seq != trigger_seq_ || !last_trigger_) {
      return;
    }
    out.started_at = last_trigger_->started_at;
    out.finished = true;
    out.finished_at = std::chrono::system_clock::now();
    last_trigger_ = std::move(out);
  }

  ListenerParams params_;
  WorkerPool &pool_;
  net::io_context ioc_;
  tcp::acceptor acceptor_;
  BoundedThread watcher_;
  std::atomic<std::uint16_t> bound_port_{0};
  std::atomic<bool> stopped_{false};
  mutable std::mutex info_mu_;
  std::string peer_;
  std::optional<TriggerOutcome> last_trigger_;
  std::uint64_t trigger_seq_ = 0;
  int triggers_in_flight_ = 0;
};
