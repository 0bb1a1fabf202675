#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace endpoint {

struct Endpoint {
  std::string user;
  std::string host;
  std::uint16_t port;
};

inline std::optional<std::uint16_t> ParsePort(const std::string &s) {
  if (s.empty() || s.size() > 5) {
    return std::nullopt;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  int v = std::atoi(s.c_str());
  if (v <= 0 || v > 65535) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(v);
}

// Accepts "host", "host:port", "[v6addr]:port", "user@host" and the same
// forms prefixed with ssh://.
inline std::optional<Endpoint> ParseTarget(const std::string &target,
                                           std::uint16_t defaultPort = 22) {
  std::string rest = boost::algorithm::trim_copy(target);
  if (boost::algorithm::istarts_with(rest, "ssh://")) {
    rest = rest.substr(6);
  }
  while (!rest.empty() && rest.back() == '/') {
    rest.pop_back();
  }
  Endpoint ep{.user = "", .host = "", .port = defaultPort};
  if (auto at = rest.rfind('@'); at != std::string::npos) {
    ep.user = rest.substr(0, at);
    rest = rest.substr(at + 1);
  }
  if (!rest.empty() && rest.front() == '[') {
    auto close = rest.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    ep.host = rest.substr(1, close - 1);
    std::string tail = rest.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return std::nullopt;
      }
      auto port = ParsePort(tail.substr(1));
      if (!port) {
        return std::nullopt;
      }
      ep.port = *port;
    }
  } else {
    auto colon = rest.find(':');
    if (colon != std::string::npos && rest.find(':', colon + 1) == std::string::npos) {
      auto port = ParsePort(rest.substr(colon + 1));
      if (!port) {
        return std::nullopt;
      }
      ep.port = *port;
      ep.host = rest.substr(0, colon);
    } else {
      // bare IPv6 literal or plain host
      ep.host = rest;
    }
  }
  if (ep.host.empty()) {
    return std::nullopt;
  }
  return ep;
}

} // namespace endpoint
