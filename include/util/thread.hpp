#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <stop_token>
#include <thread>
#include <utility>

// BoundedThread
// Threading model:
// - Wraps one std::jthread whose body signals completion through a promise
// - JoinFor() requests stop and waits at most the given bound; a worker that
//   does not finish in time is detached and keeps only what it captured
// - Joining from the worker itself is a no-op so owners may be destroyed on
//   their own thread
class BoundedThread {
public:
  BoundedThread() = default;
  BoundedThread(const BoundedThread &) = delete;
  BoundedThread &operator=(const BoundedThread &) = delete;

  ~BoundedThread() { (void)JoinFor(std::chrono::milliseconds(0)); }

  void Start(std::function<void(std::stop_token)> body) {
    std::promise<void> done;
    finished_ = done.get_future();
    thread_ = std::jthread(
        [body = std::move(body), done = std::move(done)](
            std::stop_token st) mutable {
          body(st);
          done.set_value();
        });
  }

  bool Running() const {
    return finished_.valid() &&
           finished_.wait_for(std::chrono::seconds(0)) !=
               std::future_status::ready;
  }

  // Returns false when the worker had to be detached.
  bool JoinFor(std::chrono::milliseconds bound) {
    if (!thread_.joinable()) {
      return true;
    }
    thread_.request_stop();
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
      return true;
    }
    if (finished_.valid() &&
        finished_.wait_for(bound) != std::future_status::ready) {
      thread_.detach();
      return false;
    }
    thread_.join();
    return true;
  }

private:
  std::jthread thread_;
  std::future<void> finished_;
};
