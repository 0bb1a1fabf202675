#pragma once

#include "core/config.hpp"
#include "core/worker_pool.hpp"
#include "http/http_server.hpp"
#include "http/router.hpp"
#include "logging/audit_log.hpp"
#include "logging/console.hpp"
#include "sessions/session_manager.hpp"
#include "transfer/transfer_engine.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <string>

// Service composition/threading overview:
// - WorkerPool: one thread per streamed command, local tool run or listener
//   trigger, capped at max_tasks
// - SessionManager: registry plus reaper thread; each listener owns a
//   watcher thread
// - AuditLog: dedicated jthread draining per-session lock-free queues
// - HttpServer: accept thread plus one thread per client connection
// - Main thread: waits for SIGINT/SIGTERM, then stops the server, every
//   session, the pool and the audit log in that order
inline int RunService(const config::ServiceOptions &opt) {
  ::signal(SIGPIPE, SIG_IGN);
  logging::SetDebug(opt.debug);

  net::io_context signal_ioc;
  net::signal_set signals(signal_ioc, SIGINT, SIGTERM);

  logging::AuditLog audit(opt.manager.audit_dir);
  audit.Start();
  WorkerPool pool;
  pool.Start(opt.max_tasks);
  SessionManager manager(opt.manager, opt.timeouts, pool, &audit);
  transfer::TransferEngine transfers(opt.transfer, opt.timeouts);
  api::Router router(manager, transfers, pool, opt.timeouts);
  HttpServer server(
      [&router](const HttpRequest &req) { return router.Handle(req); });

  if (auto st = server.Start(opt.bind_address, opt.port); !st) {
    logging::Error("service", "", "listen", st.error().message);
    return 1;
  }

  signals.async_wait([](const boost::system::error_code &ec, int sig) {
    if (!ec) {
      logging::Info("service", "",
                    "signal " + std::to_string(sig) + ", shutting down");
    }
  });
  signal_ioc.run();

  server.Stop();
  manager.ShutdownAll();
  pool.Stop(opt.timeouts.join);
  audit.Join();
  logging::Info("service", "", "stopped");
  return 0;
}
