#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace config {

using std::chrono::milliseconds;
using std::chrono::seconds;

// Per operation class. Every blocking wait in the manager is bounded by one
// of these.
struct Timeouts {
  milliseconds connect = seconds(10);
  milliseconds ssh_command = seconds(30);
  milliseconds shell_command = seconds(60);
  milliseconds ssh_probe = seconds(10);
  milliseconds transfer_chunk = seconds(60);
  milliseconds transfer_total = seconds(600);
  milliseconds listener_bind = seconds(5);
  milliseconds listener_connection = seconds(120);
  milliseconds trigger = seconds(10);
  milliseconds join = seconds(3);
  milliseconds heartbeat = seconds(1);
  milliseconds local_blocking = seconds(30);
  milliseconds process_grace = seconds(5);
};

struct ManagerOptions {
  std::size_t max_sessions = 32;
  milliseconds reap_interval = seconds(5);
  // zero disables idle reaping
  milliseconds idle_timeout = milliseconds(0);
  std::string audit_dir;
};

// Transfer planning. Size classes pick the nominal chunk size and rate;
// the direct threshold decides one-shot versus chunked.
struct TransferOptions {
  std::size_t direct_threshold = 64 * 1024;
  std::size_t small_limit = 1024 * 1024;
  std::size_t medium_limit = 50 * 1024 * 1024;
  std::size_t small_chunk = 4 * 1024;
  std::size_t medium_chunk = 32 * 1024;
  std::size_t large_chunk = 128 * 1024;
  double small_rate = 512.0 * 1024;
  double medium_rate = 1024.0 * 1024;
  double large_rate = 2048.0 * 1024;
  double verify_overhead_s = 0.5;
};

struct ServiceOptions {
  std::string bind_address = "0.0.0.0";
  std::uint16_t port = 5000;
  // background tasks alive at once: streams, local tools, triggers
  std::size_t max_tasks = 256;
  bool debug = false;
  ManagerOptions manager;
  Timeouts timeouts;
  TransferOptions transfer;
};

inline bool ParseBool(const char *v) {
  std::string s(v);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s == "1" || s == "true" || s == "yes" || s == "on";
}

// Environment wins over defaults but not over explicit flags; callers apply
// it before parsing argv.
inline void ApplyEnvironment(ServiceOptions &opt) {
  if (const char *v = std::getenv("API_PORT"); v && *v) {
    int port = std::atoi(v);
    if (port > 0 && port <= 65535) {
      opt.port = static_cast<std::uint16_t>(port);
    }
  }
  if (const char *v = std::getenv("DEBUG_MODE"); v && *v) {
    opt.debug = ParseBool(v);
  }
  if (const char *v = std::getenv("SHELLMUX_MAX_SESSIONS"); v && *v) {
    opt.manager.max_sessions =
        static_cast<std::size_t>(std::max(1, std::atoi(v)));
  }
  if (const char *v = std::getenv("SHELLMUX_AUDIT_DIR"); v && *v) {
    opt.manager.audit_dir = v;
  }
}

} // namespace config
