#pragma once

#include "core/event.hpp"
#include <atomic>
#include <boost/lockfree/spsc_queue.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

// Receives events from a running command. Implementations are called from
// the single producer thread of one invocation.
class EventSink {
public:
  virtual ~EventSink() = default;

  virtual void Emit(Event ev) = 0;
  // Called on every idle poll slice of the producer.
  virtual void Idle() {}
  // True once nobody is interested in further output.
  virtual bool Cancelled() const { return false; }
};

class NullSink : public EventSink {
public:
  void Emit(Event) override {}
};

// Tee that accumulates output lines into a CommandResult and forwards every
// event. Aggregated text is built from exactly the lines that were emitted.
class CollectingSink : public EventSink {
public:
  explicit CollectingSink(EventSink &next) : next_(next) {}

  void Emit(Event ev) override {
    if (auto *out = std::get_if<OutputEvent>(&ev)) {
      std::string &dst = out->source == OutputSource::kStdout
                             ? result_.stdout_text
                             : result_.stderr_text;
      dst.append(out->line);
      dst.push_back('\n');
    }
    next_.Emit(std::move(ev));
  }
  void Idle() override { next_.Idle(); }
  bool Cancelled() const override { return next_.Cancelled(); }

  CommandResult &Result() { return result_; }

private:
  EventSink &next_;
  CommandResult result_;
};

// EventChannel
// Threading model:
// - Exactly one producer (the thread running the invocation) and one consumer
//   (the caller draining it, usually an HTTP connection thread)
// - Events travel through a boost::lockfree::spsc_queue; a condition variable
//   is only a doorbell so the consumer can sleep between events
// - Once the consumer detaches, the producer drops events instead of waiting
//   for queue space
class EventChannel : public EventSink {
public:
  using Clock = std::chrono::steady_clock;

  explicit EventChannel(std::chrono::milliseconds heartbeat,
                        std::size_t capacity = 4096)
      : queue_(capacity), heartbeat_(heartbeat), last_push_(Clock::now()) {}

  void Emit(Event ev) override {
    if (closed_.load(std::memory_order_acquire)) {
      return;
    }
    const bool last = std::holds_alternative<CompleteEvent>(ev);
    while (!queue_.push(ev)) {
      if (detached_.load(std::memory_order_acquire)) {
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    last_push_ = Clock::now();
    if (last) {
      closed_.store(true, std::memory_order_release);
    }
    Ring();
  }

  // Pushes a heartbeat when nothing was emitted for one interval.
  void Idle() override {
    if (Clock::now() - last_push_ >= heartbeat_) {
      Emit(HeartbeatEvent{});
    }
  }

  bool Cancelled() const override {
    return detached_.load(std::memory_order_acquire);
  }

  // Consumer side. Returns nullopt when no event arrived within wait.
  std::optional<Event> Next(std::chrono::milliseconds wait) {
    Event ev;
    if (queue_.pop(ev)) {
      return ev;
    }
    std::unique_lock lk(bell_mu_);
    bell_cv_.wait_for(lk, wait, [this] { return queue_.read_available() > 0; });
    lk.unlock();
    if (queue_.pop(ev)) {
      return ev;
    }
    return std::nullopt;
  }

  // Drains until complete, handing every event to fn. Stops early and
  // detaches when fn returns false.
  void Drain(const std::function<bool(const Event &)> &fn) {
    for (;;) {
      auto ev = Next(std::chrono::milliseconds(200));
      if (!ev) {
        continue;
      }
      if (!fn(*ev)) {
        Detach();
        return;
      }
      if (std::holds_alternative<CompleteEvent>(*ev)) {
        return;
      }
    }
  }

  void Detach() {
    detached_.store(true, std::memory_order_release);
    Event ev;
    while (queue_.pop(ev)) {
    }
  }

  bool Closed() const { return closed_.load(std::memory_order_acquire); }

private:
  void Ring() {
    std::lock_guard lk(bell_mu_);
    bell_cv_.notify_one();
  }

  boost::lockfree::spsc_queue<Event> queue_;
  std::chrono::milliseconds heartbeat_;
  Clock::time_point last_push_;
  std::atomic<bool> detached_{false};
  std::atomic<bool> closed_{false};
  std::mutex bell_mu_;
  std::condition_variable bell_cv_;
};

// Runs body against sink and closes the sequence: exactly one result or
// error event, then complete. body returns the command outcome or an error.
template <typename Body>
inline void RunInvocation(EventSink &sink, Body &&body) {
  Result<CommandResult> r = body(sink);
  if (r) {
    sink.Emit(ResultEvent{r->Success(), r->exit_code, r->timed_out});
  } else {
    sink.Emit(ErrorEvent{r.error().kind, r.error().message});
  }
  sink.Emit(CompleteEvent{});
}
