#pragma once

#include "core/config.hpp"
#include "core/event_channel.hpp"
#include "core/worker_pool.hpp"
#include "logging/audit_log.hpp"
#include "logging/console.hpp"
#include "net/endpoint.hpp"
#include "sessions/listener_transport.hpp"
#include "sessions/session.hpp"
#include "sessions/ssh_transport.hpp"
#include "util/thread.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

struct SshRequest {
  // host, host:port or user@host[:port]
  std::string target;
  std::optional<std::uint16_t> port;
  std::string username;
  std::optional<std::string> password;
  std::optional<std::string> key_path;
  std::optional<std::string> passphrase;
  std::optional<std::string> session_id;
};

struct ListenerRequest {
  std::uint16_t port = 0;
  ListenerType type = ListenerType::kNative;
  std::string bind_address = "0.0.0.0";
  std::optional<std::string> session_id;
};

// Construct (but do not start) transports. Replaceable in tests.
struct TransportFactory {
  std::function<std::shared_ptr<ITransport>(
      const std::string &id, const SshParams &,
      std::shared_ptr<logging::AuditTrail>)>
      ssh;
  std::function<std::shared_ptr<ITransport>(
      const std::string &id, const ListenerParams &,
      std::shared_ptr<logging::AuditTrail>)>
      listener;
};

// SessionManager
// Process-wide registry id -> Session and the only entry point other layers
// use.
// Threading model:
// - registry_mu_ guards the map, the insertion order and pending
//   reservations; it is never held across connect, execute or stop
// - Creation reserves a slot under the lock, connects or binds outside it,
//   then publishes the session, so the capacity check holds under concurrent
//   creation
// - Streamed commands run on the worker pool; a reaper thread removes
//   sessions whose transport died or that sat idle past the idle timeout
class SessionManager {
public:
  SessionManager(config::ManagerOptions options, config::Timeouts timeouts,
                 WorkerPool &pool, logging::AuditLog *audit = nullptr,
                 std::optional<TransportFactory> factory = std::nullopt)
      : options_(std::move(options)), timeouts_(timeouts), pool_(pool),
        audit_(audit),
        factory_(factory ? std::move(*factory) : DefaultFactory()) {
    reaper_.Start([this](std::stop_token st) { ReapLoop(st); });
  }

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  ~SessionManager() { ShutdownAll(); }

  Result<std::string> CreateSsh(const SshRequest &req) {
    auto ep = endpoint::ParseTarget(req.target, req.port.value_or(22));
    if (!ep) {
      return MakeError(ErrorKind::kInvalidArgument,
                       "invalid target: " + req.target);
    }
    if (req.port) {
      ep->port = *req.port;
    }
    std::string user = req.username.empty() ? ep->user : req.username;
    if (user.empty()) {
      return MakeError(ErrorKind::kInvalidArgument, "username required");
    }
    if (!req.password && !req.key_path) {
      return MakeError(ErrorKind::kAuthentication,
                       "password or key_path required");
    }
    const std::string id = req.session_id.value_or("ssh_" + ep->host + "_" + user);
    SshParams params{.host = ep->host,
                     .port = ep->port,
                     .credentials = {.username = user,
                                     .password = req.password,
                                     .key_path = req.key_path,
                                     .passphrase = req.passphrase}};
    return Create(id,
                  {{"target", ep->host},
                   {"port", std::to_string(ep->port)},
                   {"username", user}},
                  [&](std::shared_ptr<logging::AuditTrail> trail) {
                    return factory_.ssh(id, params, std::move(trail));
                  });
  }

  Result<std::string> CreateListener(const ListenerRequest &req) {
    std::string id;
    if (req.session_id) {
      id = *req.session_id;
    } else if (req.port != 0) {
      id = "shell_" + std::to_string(req.port);
    } else {
      id = "shell_auto_" + std::to_string(++auto_ids_);
    }
    ListenerParams params{.bind_address = req.bind_address,
                          .port = req.port,
                          .type = req.type};
    return Create(id,
                  {{"listener_type", std::string(ListenerTypeName(req.type))}},
                  [&](std::shared_ptr<logging::AuditTrail> trail) {
                    return factory_.listener(id, params, std::move(trail));
                  });
  }

  Result<std::shared_ptr<Session>> Get(const std::string &id) const {
    std::lock_guard lk(registry_mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      return MakeError(ErrorKind::kNotFound, "session not found: " + id);
    }
    return it->second;
  }

  // Insertion order. Per-session fields are read after the registry lock is
  // released.
  std::vector<SessionSummary> List() const {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
      std::lock_guard lk(registry_mu_);
      snapshot.reserve(order_.size());
      for (const auto &id : order_) {
        snapshot.push_back(sessions_.at(id));
      }
    }
    std::vector<SessionSummary> out;
    out.reserve(snapshot.size());
    for (const auto &s : snapshot) {
      out.push_back(s->Summary());
    }
    return out;
  }

  std::size_t Count() const {
    std::lock_guard lk(registry_mu_);
    return sessions_.size();
  }

  Result<CommandResult> Execute(const std::string &id,
                                const std::string &command,
                                std::optional<std::chrono::milliseconds> timeout,
                                EventSink &sink) {
    auto s = Get(id);
    if (!s) {
      return std::unexpected(s.error());
    }
    return ExecuteOn(**s, command, timeout, sink);
  }

  Result<CommandResult> Execute(const std::string &id,
                                const std::string &command,
                                std::optional<std::chrono::milliseconds> timeout =
                                    std::nullopt) {
    NullSink sink;
    return Execute(id, command, timeout, sink);
  }

  // Returns a channel the caller drains; the command runs on its own pool
  // thread.
  Result<std::shared_ptr<EventChannel>>
  ExecuteStreaming(const std::string &id, const std::string &command,
                   std::optional<std::chrono::milliseconds> timeout =
                       std::nullopt) {
    auto s = Get(id);
    if (!s) {
      return std::unexpected(s.error());
    }
    auto channel = std::make_shared<EventChannel>(timeouts_.heartbeat);
    const bool posted = pool_.Post([session = *s, channel, command, timeout] {
      RunInvocation(*channel, [&](EventSink &sink) {
        return ExecuteOn(*session, command, timeout, sink);
      });
    });
    if (!posted) {
      return MakeError(ErrorKind::kCapacity,
                       "too many background tasks, retry later");
    }
    return channel;
  }

  Result<TriggerAck> SendPayload(const std::string &id,
                                 const std::string &command) {
    auto s = Get(id);
    if (!s) {
      return std::unexpected(s.error());
    }
    (*s)->Touch(false);
    return (*s)->Transport().SendPayload(command);
  }

  // Idempotent. Returns true when a live session was removed.
  bool Stop(const std::string &id) noexcept {
    std::shared_ptr<Session> s;
    {
      std::lock_guard lk(registry_mu_);
      auto it = sessions_.find(id);
      if (it == sessions_.end()) {
        return false;
      }
      s = std::move(it->second);
      sessions_.erase(it);
      order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }
    s->Transport().Stop();
    logging::Info("manager", id, "session stopped");
    return true;
  }

  // Stops every session concurrently; called once at teardown.
  void ShutdownAll() noexcept {
    if (shut_down_.exchange(true)) {
      return;
    }
    if (!reaper_.JoinFor(timeouts_.join)) {
      logging::Warn("manager", "", "reaper did not exit within join bound");
    }
    std::vector<std::shared_ptr<Session>> all;
    {
      std::lock_guard lk(registry_mu_);
      for (const auto &id : order_) {
        all.push_back(sessions_.at(id));
      }
      sessions_.clear();
      order_.clear();
    }
    if (all.empty()) {
      return;
    }
    logging::Info("manager", "",
                  "stopping " + std::to_string(all.size()) + " session(s)");
    std::vector<std::jthread> stoppers;
    stoppers.reserve(all.size());
    for (auto &s : all) {
      try {
        stoppers.emplace_back([s] { s->Transport().Stop(); });
      } catch (const std::system_error &e) {
        logging::Error("manager", s->Id(), "shutdown", e.what());
        s->Transport().Stop();
      }
    }
  }

  const config::Timeouts &Timeouts() const { return timeouts_; }

private:
  template <typename Make>
  Result<std::string> Create(const std::string &id,
                             std::map<std::string, std::string> metadata,
                             Make &&make) {
    if (id.empty()) {
      return MakeError(ErrorKind::kInvalidArgument, "empty session id");
    }
    {
      std::lock_guard lk(registry_mu_);
      if (shut_down_.load()) {
        return MakeError(ErrorKind::kCapacity, "manager is shutting down");
      }
      if (sessions_.contains(id) || pending_.contains(id)) {
        return MakeError(ErrorKind::kConflict, "session already exists: " + id);
      }
      if (sessions_.size() + pending_.size() >= options_.max_sessions) {
        return MakeError(ErrorKind::kCapacity,
                         "session limit of " +
                             std::to_string(options_.max_sessions) + " reached");
      }
      pending_.insert(id);
    }
    auto release = [this, &id] {
      std::lock_guard lk(registry_mu_);
      pending_.erase(id);
    };
    auto trail = audit_ ? audit_->Open(id)
                        : std::make_shared<logging::AuditTrail>();
    std::shared_ptr<ITransport> transport = make(trail);
    if (auto st = transport->Start(); !st) {
      transport->Stop();
      trail->Close();
      release();
      return std::unexpected(st.error());
    }
    auto session =
        std::make_shared<Session>(id, std::move(transport), std::move(metadata));
    {
      std::lock_guard lk(registry_mu_);
      pending_.erase(id);
      sessions_.emplace(id, session);
      order_.push_back(id);
    }
    logging::Info("manager", id,
                  std::string("session created (") +
                      std::string(TransportKindName(session->Kind())) + ")");
    return id;
  }

  static Result<CommandResult> ExecuteOn(Session &s, const std::string &command,
                                  std::optional<std::chrono::milliseconds> timeout,
                                  EventSink &sink) {
    s.Touch(true);
    auto r = s.Transport().Execute(
        command, timeout.value_or(s.Transport().DefaultTimeout()), sink);
    s.Touch(false);
    return r;
  }

  void ReapLoop(std::stop_token st) {
    while (!st.stop_requested()) {
      retry::WaitSync(static_cast<std::size_t>(options_.reap_interval.count()),
                      st);
      if (st.stop_requested()) {
        return;
      }
      std::vector<std::string> victims;
      const auto now = std::chrono::system_clock::now();
      {
        std::lock_guard lk(registry_mu_);
        for (const auto &[id, s] : sessions_) {
          const auto &t = s->Transport();
          bool idle = options_.idle_timeout.count() > 0 &&
                      t.State() != TransportState::kExecuting &&
                      now - s->LastActivity() > options_.idle_timeout;
          if (!t.Alive() || idle) {
            victims.push_back(id);
          }
        }
      }
      for (const auto &id : victims) {
        logging::Info("manager", id, "reaping dead or idle session");
        Stop(id);
      }
    }
  }

  TransportFactory DefaultFactory() {
    TransportFactory f;
    f.ssh = [this](const std::string &id, const SshParams &p,
                   std::shared_ptr<logging::AuditTrail> trail) {
      return std::make_shared<SshTransport>(id, p, timeouts_, std::move(trail));
    };
    f.listener = [this](const std::string &id, const ListenerParams &p,
                        std::shared_ptr<logging::AuditTrail> trail) {
      return std::make_shared<ListenerTransport>(id, p, pool_, timeouts_,
                                                 std::move(trail));
    };
    return f;
  }

  config::ManagerOptions options_;
  config::Timeouts timeouts_;
  WorkerPool &pool_;
  logging::AuditLog *audit_;
  TransportFactory factory_;
  mutable std::mutex registry_mu_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  std::vector<std::string> order_;
  std::set<std::string> pending_;
  std::atomic<std::uint64_t> auto_ids_{0};
  std::atomic<bool> shut_down_{false};
  BoundedThread reaper_;
};

// Adapts one managed session to the command-runner interface used by the
// transfer engine.
class SessionCommandRunner : public ICommandRunner {
public:
  SessionCommandRunner(SessionManager &manager, std::string id)
      : manager_(manager), id_(std::move(id)) {}

  Result<CommandResult> Run(const std::string &command,
                            std::chrono::milliseconds timeout) override {
    return manager_.Execute(id_, command, timeout);
  }

  std::size_t MaxCommandLength() const override {
    auto s = manager_.Get(id_);
    return s ? (*s)->Transport().MaxCommandLength() : 0;
  }

private:
  SessionManager &manager_;
  std::string id_;
};
