#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

// namespace toolpolicy: what the local executor allows, streams by default,
// and how long each tool may run.
namespace toolpolicy {

inline constexpr std::string_view kStreamingTools[] = {
    "ffuf", "gobuster", "feroxbuster", "wfuzz", "dirsearch",
    "dirb", "nikto",    "ping",        "bash"};

// Interactive or connection-holding tools belong to a session.
inline constexpr std::string_view kBlockedTools[] = {"ssh",    "scp", "rsync",
                                                     "nc",     "netcat",
                                                     "telnet"};

struct ToolTimeout {
  std::string_view tool;
  std::chrono::seconds timeout;
};

inline constexpr ToolTimeout kToolTimeouts[] = {
    {"ffuf", std::chrono::seconds(1800)},
    {"gobuster", std::chrono::seconds(1800)},
    {"feroxbuster", std::chrono::seconds(1800)},
    {"wfuzz", std::chrono::seconds(1800)},
    {"dirsearch", std::chrono::seconds(1800)},
    {"nikto", std::chrono::seconds(1800)},
    {"dirb", std::chrono::seconds(1800)},
    {"nmap", std::chrono::seconds(3600)},
};

inline constexpr std::chrono::seconds kDefaultTimeout{300};

// Executable name of the first simple command: leading VAR=value
// assignments and sudo are skipped, directories stripped.
inline std::string ToolName(const std::string &command) {
  std::vector<std::string> words;
  boost::algorithm::split(words, command, boost::algorithm::is_space(),
                          boost::algorithm::token_compress_on);
  for (const auto &w : words) {
    if (w.empty() || w == "sudo" ||
        (w.find('=') != std::string::npos && w.front() != '-')) {
      continue;
    }
    auto slash = w.rfind('/');
    return slash == std::string::npos ? w : w.substr(slash + 1);
  }
  return {};
}

inline bool IsBlocked(const std::string &tool) {
  for (auto t : kBlockedTools) {
    if (tool == t) {
      return true;
    }
  }
  return false;
}

inline bool IsStreaming(const std::string &tool) {
  for (auto t : kStreamingTools) {
    if (tool == t) {
      return true;
    }
  }
  return false;
}

inline std::chrono::seconds TimeoutFor(const std::string &tool) {
  for (const auto &t : kToolTimeouts) {
    if (boost::algorithm::equals(tool, t.tool)) {
      return t.timeout;
    }
  }
  return kDefaultTimeout;
}

} // namespace toolpolicy
