#include "core/config.hpp"
#include "core/service.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

static void PrintUsage(const char *argv0) {
  std::cout
      << "usage: " << argv0 << " [options]\n"
      << "  -b, --bind ADDR          listen address (default 0.0.0.0)\n"
      << "  -p, --port PORT          listen port (default 5000, env API_PORT)\n"
      << "  -w, --max-tasks N        concurrent background tasks (default 256)\n"
      << "  -m, --max-sessions N     concurrent session cap (default 32)\n"
      << "  -a, --audit-dir DIR      per-session audit logs\n"
      << "  -i, --idle-timeout SEC   reap sessions idle this long (0 = never)\n"
      << "  -c, --command-timeout S  default reverse-shell command timeout\n"
      << "  -l, --listen-timeout S   wait for a reverse connection this long\n"
      << "  -d, --debug              verbose logging (env DEBUG_MODE)\n";
}

static config::ServiceOptions ParseArgs(int argc, char **argv) {
  config::ServiceOptions opt;
  config::ApplyEnvironment(opt);
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-b" || a == "--bind") && i + 1 < argc)
      opt.bind_address = argv[++i];
    else if ((a == "-p" || a == "--port") && i + 1 < argc)
      opt.port = static_cast<std::uint16_t>(
          std::clamp(std::atoi(argv[++i]), 0, 65535));
    else if ((a == "-w" || a == "--max-tasks") && i + 1 < argc)
      opt.max_tasks =
          static_cast<std::size_t>(std::max(1, std::atoi(argv[++i])));
    else if ((a == "-m" || a == "--max-sessions") && i + 1 < argc)
      opt.manager.max_sessions =
          static_cast<std::size_t>(std::max(1, std::atoi(argv[++i])));
    else if ((a == "-a" || a == "--audit-dir") && i + 1 < argc)
      opt.manager.audit_dir = argv[++i];
    else if ((a == "-i" || a == "--idle-timeout") && i + 1 < argc)
      opt.manager.idle_timeout =
          std::chrono::seconds(std::max(0, std::atoi(argv[++i])));
    else if ((a == "-c" || a == "--command-timeout") && i + 1 < argc)
      opt.timeouts.shell_command =
          std::chrono::seconds(std::max(1, std::atoi(argv[++i])));
    else if ((a == "-l" || a == "--listen-timeout") && i + 1 < argc)
      opt.timeouts.listener_connection =
          std::chrono::seconds(std::max(1, std::atoi(argv[++i])));
    else if (a == "-d" || a == "--debug")
      opt.debug = true;
    else if (a == "-h" || a == "--help") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else {
      std::cerr << "Unknown option: " << a << "\n";
      PrintUsage(argv[0]);
      std::exit(2);
    }
  }
  return opt;
}

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  std::cout << "shellmuxd on " << opt.bind_address << ":" << opt.port
            << " with max_tasks=" << opt.max_tasks
            << ", max_sessions=" << opt.manager.max_sessions
            << (opt.manager.audit_dir.empty()
                    ? std::string()
                    : ", audit='" + opt.manager.audit_dir + "'")
            << "\n";
  return RunService(opt);
}
