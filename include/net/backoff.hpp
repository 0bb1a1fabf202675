#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <stop_token>
#include <thread>

// namespace retry: backoff for transient accept/poll failures in watchers.
namespace retry {

struct Backoff {
  std::size_t current_ms = 50;
  std::size_t max_ms = 1000;

  void Reset() { current_ms = 50; }
  std::size_t Next() {
    std::size_t v = current_ms;
    current_ms = std::min(max_ms, current_ms * 2);
    return v;
  }
};

// Sleeps in short slices so a stop request is honoured promptly.
inline void WaitSync(std::size_t ms, const std::stop_token &st) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

} // namespace retry
