#pragma once

#include "logging/console.hpp"
#include "util/thread.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>

// WorkerPool
// Threading model:
// - Every posted task gets its own BoundedThread, so a command that runs for
//   an hour never delays a trigger or another session's stream
// - The number of tasks alive at once is capped; Post() returns false at the
//   cap or after Stop() and the caller reports the refusal
// - Finished threads are reaped on the next Post(); Stop() joins the rest
//   with a bounded wait and detaches stragglers, which keep only what their
//   task captured
class WorkerPool {
public:
  WorkerPool() = default;
  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void Start(std::size_t maxTasks) {
    std::lock_guard lk(mu_);
    max_tasks_ = maxTasks;
    accepting_ = true;
  }

  template <typename Fn> [[nodiscard]] bool Post(Fn &&fn) {
    std::lock_guard lk(mu_);
    if (!accepting_) {
      return false;
    }
    Prune();
    if (tasks_.size() >= max_tasks_) {
      logging::Warn("pool", "",
                    "task cap of " + std::to_string(max_tasks_) + " reached");
      return false;
    }
    auto t = std::make_unique<BoundedThread>();
    t->Start([fn = std::forward<Fn>(fn)](std::stop_token) mutable {
      try {
        fn();
      } catch (const std::exception &e) {
        logging::Error("pool", "", "task", e.what());
      }
    });
    tasks_.push_back(std::move(t));
    return true;
  }

  std::size_t Active() {
    std::lock_guard lk(mu_);
    Prune();
    return tasks_.size();
  }

  void Stop(std::chrono::milliseconds bound = std::chrono::seconds(5)) {
    std::list<std::unique_ptr<BoundedThread>> tasks;
    {
      std::lock_guard lk(mu_);
      accepting_ = false;
      tasks.swap(tasks_);
    }
    const auto deadline = std::chrono::steady_clock::now() + bound;
    std::size_t detached = 0;
    for (auto &t : tasks) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (!t->JoinFor(std::max(left, std::chrono::milliseconds(0)))) {
        ++detached;
      }
    }
    if (detached > 0) {
      logging::Warn("pool", "",
                    std::to_string(detached) +
                        " task(s) still running at shutdown, detached");
    }
  }

  ~WorkerPool() { Stop(std::chrono::milliseconds(0)); }

private:
  void Prune() {
    tasks_.remove_if([](const std::unique_ptr<BoundedThread> &t) {
      return !t->Running() && t->JoinFor(std::chrono::milliseconds(0));
    });
  }

  std::mutex mu_;
  std::list<std::unique_ptr<BoundedThread>> tasks_;
  std::size_t max_tasks_ = 0;
  bool accepting_ = false;
};
