#pragma once

#include "sessions/itransport.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct SessionSummary {
  std::string id;
  TransportKind kind;
  TransportState state;
  bool connected;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point last_activity;
  std::uint64_t command_count;
  std::map<std::string, std::string> metadata;
  std::optional<TriggerOutcome> last_trigger;
};

// Session
// One transport plus bookkeeping. Identity and the transport pointer are
// immutable; activity fields sit behind the session's own mutex so a slow
// command on one session never blocks summaries of another.
class Session {
public:
  Session(std::string id, std::shared_ptr<ITransport> transport,
          std::map<std::string, std::string> metadata)
      : id_(std::move(id)), transport_(std::move(transport)),
        created_at_(std::chrono::system_clock::now()),
        last_activity_(created_at_), metadata_(std::move(metadata)) {}

  const std::string &Id() const { return id_; }
  TransportKind Kind() const { return transport_->Kind(); }
  ITransport &Transport() const { return *transport_; }
  bool Connected() const { return transport_->IsConnected(); }

  void Touch(bool command) {
    std::lock_guard lk(mu_);
    last_activity_ = std::chrono::system_clock::now();
    if (command) {
      ++command_count_;
    }
  }

  std::chrono::system_clock::time_point LastActivity() const {
    std::lock_guard lk(mu_);
    return last_activity_;
  }

  SessionSummary Summary() const {
    SessionSummary s{.id = id_,
                     .kind = transport_->Kind(),
                     .state = transport_->State(),
                     .connected = transport_->IsConnected(),
                     .created_at = created_at_,
                     .last_activity = {},
                     .command_count = 0,
                     .metadata = transport_->Describe(),
                     .last_trigger = transport_->LastTrigger()};
    std::lock_guard lk(mu_);
    s.last_activity = last_activity_;
    s.command_count = command_count_;
    for (const auto &[k, v] : metadata_) {
      s.metadata.emplace(k, v);
    }
    return s;
  }

private:
  const std::string id_;
  const std::shared_ptr<ITransport> transport_;
  const std::chrono::system_clock::time_point created_at_;
  mutable std::mutex mu_;
  std::chrono::system_clock::time_point last_activity_;
  std::uint64_t command_count_ = 0;
  std::map<std::string, std::string> metadata_;
};
