#pragma once

#include "util/time.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

// Console diagnostics: one line per record,
//   12:00:01 [ssh ssh_10.0.0.5_root] connect error: Connection refused
// Info goes to stdout, warnings and errors to stderr.
namespace logging {

inline std::atomic<bool> &DebugFlag() {
  static std::atomic<bool> flag{false};
  return flag;
}

inline void SetDebug(bool on) { DebugFlag().store(on); }

inline std::mutex &ConsoleMutex() {
  static std::mutex mu;
  return mu;
}

inline void Write(std::ostream &os, std::string_view component,
                  std::string_view id, std::string_view text) {
  std::ostringstream line;
  line << timeutil::ClockTime() << " [" << component;
  if (!id.empty()) {
    line << " " << id;
  }
  line << "] " << text << "\n";
  std::lock_guard lk(ConsoleMutex());
  os << line.str();
  os.flush();
}

inline void Info(std::string_view component, std::string_view id,
                 std::string_view text) {
  Write(std::cout, component, id, text);
}

inline void Debug(std::string_view component, std::string_view id,
                  std::string_view text) {
  if (DebugFlag().load(std::memory_order_relaxed)) {
    Write(std::cout, component, id, text);
  }
}

inline void Warn(std::string_view component, std::string_view id,
                 std::string_view text) {
  Write(std::cerr, component, id, text);
}

inline void Error(std::string_view component, std::string_view id,
                  std::string_view stage, std::string_view message) {
  std::ostringstream text;
  text << stage << " error: " << message;
  Write(std::cerr, component, id, text.str());
}

} // namespace logging
