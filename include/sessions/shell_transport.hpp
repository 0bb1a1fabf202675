#pragma once

#include "core/config.hpp"
#include "core/event_channel.hpp"
#include "logging/audit_log.hpp"
#include "logging/console.hpp"
#include "sessions/itransport.hpp"
#include "terminal/shell_protocol.hpp"
#include "terminal/terminal_bridge.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// ShellTransport
// Shared execution logic of both adapters: commands are framed with
// BEGIN/DONE markers, written to the terminal bridge and read back line by
// line until the DONE marker or the deadline.
// Threading model:
// - Execute() is serialized by a timed mutex; a caller waiting longer than
//   its own timeout gets kTimeout
// - The bridge pointer is swapped under a small mutex so Stop() on another
//   thread can interrupt a read in progress
// - State is an atomic so List/Describe never wait for a running command
class ShellTransport : public ITransport {
public:
  using Clock = std::chrono::steady_clock;

  ShellTransport(std::string id, config::Timeouts timeouts,
                 std::shared_ptr<logging::AuditTrail> audit)
      : id_(std::move(id)), timeouts_(timeouts),
        audit_(audit ? std::move(audit)
                     : std::make_shared<logging::AuditTrail>()) {}

  Result<CommandResult> Execute(const std::string &command,
                                std::chrono::milliseconds timeout,
                                EventSink &sink) override {
    const auto deadline = Clock::now() + timeout;
    std::unique_lock lk(cmd_mu_, std::defer_lock);
    if (!lk.try_lock_until(deadline)) {
      return MakeError(ErrorKind::kTimeout,
                       "session busy for " + std::to_string(timeout.count()) +
                           "ms");
    }
    auto bridge = CurrentBridge();
    TransportState expected = TransportState::kConnected;
    if (!bridge ||
        !state_.compare_exchange_strong(expected, TransportState::kExecuting)) {
      return MakeError(ErrorKind::kConnection,
                       std::string("session not connected (") +
                           std::string(TransportStateName(State())) + ")");
    }
    audit_->Record("exec", command);
    auto r = RunFramed(*bridge, command, deadline, sink);
    if (r) {
      audit_->Record("exit", std::to_string(r->exit_code));
    } else {
      audit_->Record("fail", r.error().message);
    }
    return r;
  }

  Result<CommandResult> RunCommand(const std::string &command,
                                   std::chrono::milliseconds timeout) {
    NullSink sink;
    return Execute(command, timeout, sink);
  }

  TransportState State() const override {
    return state_.load(std::memory_order_acquire);
  }

  bool IsConnected() const override {
    auto s = State();
    return s == TransportState::kConnected || s == TransportState::kExecuting;
  }

  std::size_t MaxCommandLength() const override {
    auto bridge = CurrentBridge();
    return bridge ? bridge->MaxCommandLength()
                  : FdStream::kTerminalLineLimit;
  }

  const std::string &Id() const { return id_; }

protected:
  std::shared_ptr<TerminalBridge> CurrentBridge() const {
    std::lock_guard lk(bridge_mu_);
    return bridge_;
  }

  void InstallBridge(std::shared_ptr<TerminalBridge> bridge) {
    std::lock_guard lk(bridge_mu_);
    bridge_ = std::move(bridge);
  }

  std::shared_ptr<TerminalBridge> TakeBridge() {
    std::lock_guard lk(bridge_mu_);
    return std::exchange(bridge_, nullptr);
  }

  // Moves to target unless the transport was already terminated.
  void SetState(TransportState target) {
    auto cur = state_.load(std::memory_order_acquire);
    while (cur != TransportState::kTerminated &&
           !state_.compare_exchange_weak(cur, target)) {
    }
  }

  bool CompareSetState(TransportState from, TransportState to) {
    return state_.compare_exchange_strong(from, to);
  }

  // Interrupts a running command and waits a bounded time for it to return.
  // The returned lock does not own the mutex when the command did not let go
  // in time.
  std::unique_lock<std::timed_mutex> InterruptAndWait() {
    if (auto bridge = CurrentBridge()) {
      bridge->Interrupt();
    }
    std::unique_lock lk(cmd_mu_, std::defer_lock);
    (void)lk.try_lock_for(timeouts_.join);
    return lk;
  }

  std::string id_;
  config::Timeouts timeouts_;
  std::shared_ptr<logging::AuditTrail> audit_;
  std::atomic<TransportState> state_{TransportState::kInitialized};

private:
  Result<CommandResult> RunFramed(TerminalBridge &bridge,
                                  const std::string &command,
                                  Clock::time_point deadline,
                                  EventSink &sink) {
    auto framed = shellproto::Frame(command, shellproto::NextMarkerId());
    if (framed.text.size() > bridge.MaxCommandLength()) {
      SetState(TransportState::kConnected);
      return MakeError(ErrorKind::kInvalidArgument,
                       "command of " + std::to_string(framed.text.size()) +
                           " bytes exceeds channel limit of " +
                           std::to_string(bridge.MaxCommandLength()));
    }
    if (auto st = bridge.Submit(framed.text, deadline); !st) {
      return Fail(bridge, st.error());
    }

    CollectingSink collect(sink);
    shellproto::MarkerParser parser(framed);
    bool finished = false;
    int exitCode = -1;
    while (!finished) {
      const auto now = Clock::now();
      if (now >= deadline) {
        SetState(TransportState::kConnected);
        return MakeError(ErrorKind::kTimeout,
                         "no completion signal for: " + command);
      }
      auto slice = std::min<Clock::duration>(std::chrono::milliseconds(200),
                                             deadline - now);
      auto r = bridge.ReadLines(
          std::chrono::duration_cast<std::chrono::milliseconds>(slice) +
              std::chrono::milliseconds(1),
          [&](OutputSource src, std::string line) {
            if (finished) {
              return;
            }
            auto step = parser.Feed(std::move(line));
            switch (step.kind) {
            case shellproto::MarkerParser::Kind::kIgnore:
              break;
            case shellproto::MarkerParser::Kind::kOutput:
              collect.Emit(OutputEvent{src, std::move(step.line)});
              break;
            case shellproto::MarkerParser::Kind::kDone:
              if (!step.line.empty()) {
                collect.Emit(OutputEvent{src, std::move(step.line)});
              }
              exitCode = step.exit_code;
              finished = true;
              break;
            }
          });
      if (!r) {
        if (parser.Started()) {
          for (auto &[src, line] : bridge.FlushPartial()) {
            collect.Emit(OutputEvent{src, std::move(line)});
          }
        }
        return Fail(bridge, r.error());
      }
      if (*r == 0 && !finished) {
        collect.Idle();
      }
    }
    SetState(TransportState::kConnected);
    CommandResult res = std::move(collect.Result());
    res.exit_code = exitCode;
    return res;
  }

  Result<CommandResult> Fail(TerminalBridge &bridge, const Error &err) {
    if (err.kind == ErrorKind::kTimeout) {
      SetState(TransportState::kConnected);
      return std::unexpected(err);
    }
    if (!bridge.Closed()) {
      bridge.Interrupt();
    }
    SetState(TransportState::kDisconnected);
    logging::Error(TransportKindName(Kind()), id_, "channel", err.message);
    audit_->Record("disconnected", err.message);
    return MakeError(ErrorKind::kConnection, "channel closed: " + err.message);
  }

  mutable std::mutex bridge_mu_;
  std::shared_ptr<TerminalBridge> bridge_;
  std::timed_mutex cmd_mu_;
};
