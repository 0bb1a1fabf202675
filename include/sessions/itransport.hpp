#pragma once

#include "core/error.hpp"
#include "core/event.hpp"
#include "core/event_channel.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

enum class TransportKind { kSsh, kReverseShell };

enum class TransportState {
  kInitialized,
  kConnecting,
  kListening,
  kTriggering,
  kConnected,
  kExecuting,
  kDisconnected,
  kTerminated,
};

inline std::string_view TransportKindName(TransportKind k) {
  return k == TransportKind::kSsh ? "ssh" : "reverse_shell";
}

inline std::string_view TransportStateName(TransportState s) {
  switch (s) {
  case TransportState::kInitialized:
    return "initialized";
  case TransportState::kConnecting:
    return "connecting";
  case TransportState::kListening:
    return "listening";
  case TransportState::kTriggering:
    return "triggering";
  case TransportState::kConnected:
    return "connected";
  case TransportState::kExecuting:
    return "executing";
  case TransportState::kDisconnected:
    return "disconnected";
  case TransportState::kTerminated:
    return "terminated";
  }
  return "unknown";
}

struct TriggerOutcome {
  std::string command;
  bool finished = false;
  bool success = false;
  int exit_code = -1;
  bool timed_out = false;
  std::string output;
  std::string error;
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
};

struct TriggerAck {
  bool accepted;
  std::string message;
};

// Runs shell commands somewhere. The transfer engine only needs this much.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  virtual Result<CommandResult> Run(const std::string &command,
                                    std::chrono::milliseconds timeout) = 0;
  virtual std::size_t MaxCommandLength() const = 0;
};

// ITransport
// Common contract of the SSH and listener adapters. A transport owns exactly
// one OS process or socket. Execute() calls on one transport are serialized;
// Stop() may be called from any thread at any time and never throws.
class ITransport {
public:
  virtual ~ITransport() = default;

  // Connects (SSH) or binds and starts watching (listener).
  virtual Status Start() = 0;
  // Runs command, emitting output lines to sink as they arrive. A missing
  // completion signal within timeout yields kTimeout; a closed channel
  // yields kConnection and moves the transport to Disconnected.
  virtual Result<CommandResult> Execute(const std::string &command,
                                        std::chrono::milliseconds timeout,
                                        EventSink &sink) = 0;
  virtual void Stop() noexcept = 0;

  virtual TransportKind Kind() const = 0;
  virtual TransportState State() const = 0;
  virtual bool IsConnected() const = 0;
  // False once the transport can never execute again; the reaper removes it.
  virtual bool Alive() const = 0;
  virtual std::size_t MaxCommandLength() const = 0;
  virtual std::chrono::milliseconds DefaultTimeout() const = 0;
  virtual std::map<std::string, std::string> Describe() const = 0;

  // Listener only: runs a command meant to make the target connect back.
  virtual Result<TriggerAck> SendPayload(const std::string &) {
    return MakeError(ErrorKind::kInvalidArgument,
                     "payload triggers need a listener session");
  }
  virtual std::optional<TriggerOutcome> LastTrigger() const {
    return std::nullopt;
  }
};
