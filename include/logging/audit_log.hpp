#pragma once

#include "io/file_writer.hpp"
#include "logging/console.hpp"
#include "util/branch.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <atomic>
#include <boost/lockfree/queue.hpp>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace logging {

// Fixed-size record so the queue stays lock-free.
struct AuditRecord {
  std::uint16_t len;
  char buf[254];
};

inline constexpr std::size_t kAuditQueueCapacity = 1024;

using AuditQueue =
    boost::lockfree::queue<AuditRecord,
                           boost::lockfree::capacity<kAuditQueueCapacity>>;

// Per-session producer handle. Any thread of the session may record; records
// are dropped when the queue is full or the trail is disabled.
class AuditTrail {
public:
  AuditTrail() = default;
  explicit AuditTrail(bool enabled) : enabled_(enabled) {}

  void Record(std::string_view kind, std::string_view text) {
    if (!enabled_ || closed_.load(std::memory_order_acquire)) {
      return;
    }
    AuditRecord rec;
    std::string line = timeutil::ClockTime();
    line.push_back(' ');
    line.append(kind);
    line.push_back(' ');
    const std::size_t room = sizeof(rec.buf) - line.size() - 1;
    if (text.size() > room) {
      line.append(text.substr(0, room - 3));
      line.append("...");
    } else {
      line.append(text);
    }
    std::replace(line.begin(), line.end(), '\n', ' ');
    line.push_back('\n');
    rec.len = static_cast<std::uint16_t>(line.size());
    std::memcpy(rec.buf, line.data(), line.size());
    if (!queue_.push(rec)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  void Close() { closed_.store(true, std::memory_order_release); }
  bool Closed() const { return closed_.load(std::memory_order_acquire); }
  std::uint64_t Dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }

  AuditQueue &Queue() { return queue_; }

private:
  bool enabled_ = false;
  std::atomic<bool> closed_{false};
  std::atomic<std::uint64_t> dropped_{0};
  AuditQueue queue_;
};

// AuditLog
// Threading model:
// - One background std::jthread drains every session's queue round-robin and
//   appends batches to the session's file with writev
// - Sessions register and close from any thread; the registration list is
//   guarded by a mutex that the drain loop holds only while taking a snapshot
// - A closed trail is drained one last time before its file is closed
class AuditLog {
public:
  explicit AuditLog(std::string dir) : dir_(std::move(dir)) {}
  AuditLog(const AuditLog &) = delete;
  AuditLog &operator=(const AuditLog &) = delete;

  ~AuditLog() { Join(); }

  bool Enabled() const { return !dir_.empty(); }

  void Start() {
    if (!Enabled() || running_.exchange(true)) {
      return;
    }
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
      Error("audit", "", "mkdir", ec.message());
    }
    worker_ = std::jthread([this](std::stop_token st) { RunLoop(st); });
  }

  void Join() {
    if (worker_.joinable()) {
      worker_.request_stop();
      worker_.join();
    }
    running_.store(false);
    std::lock_guard lk(mu_);
    for (auto &e : entries_) {
      DrainQueue(e);
      CloseEntry(e);
    }
    entries_.clear();
  }

  // Opens <dir>/<session>_<timestamp>.log. Without a directory the returned
  // trail records nothing.
  std::shared_ptr<AuditTrail> Open(const std::string &sessionId) {
    if (!Enabled()) {
      return std::make_shared<AuditTrail>(false);
    }
    std::string path =
        dir_ + "/" + sessionId + "_" + timeutil::TimestampForFile() + ".log";
    int fd =
        ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
      Error("audit", sessionId, "open", std::strerror(errno));
      return std::make_shared<AuditTrail>(false);
    }
    auto trail = std::make_shared<AuditTrail>(true);
    std::lock_guard lk(mu_);
    entries_.push_back(Entry{trail, fd});
    return trail;
  }

private:
  struct Entry {
    std::shared_ptr<AuditTrail> trail;
    int fd;
  };

  void RunLoop(std::stop_token st) {
    while (!st.stop_requested()) {
      bool any = false;
      {
        std::lock_guard lk(mu_);
        for (auto &e : entries_) {
          any |= DrainQueue(e);
        }
        auto closed = std::remove_if(entries_.begin(), entries_.end(),
                                     [](Entry &e) {
                                       if (!e.trail->Closed()) {
                                         return false;
                                       }
                                       DrainQueue(e);
                                       CloseEntry(e);
                                       return true;
                                     });
        entries_.erase(closed, entries_.end());
      }
      if (!any) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
      }
    }
  }

  static void CloseEntry(Entry &e) {
    if (e.fd != -1) {
      ::close(e.fd);
      e.fd = -1;
    }
  }

  // Returns true when something was written.
  static bool DrainQueue(Entry &e) {
    if (SHELLMUX_UNLIKELY(e.fd == -1)) {
      return false;
    }
    auto &q = e.trail->Queue();
    constexpr int kBatch = 64;
    AuditRecord recs[kBatch];
    struct iovec iov[kBatch];
    int cnt = 0;
    bool wrote = false;
    while (q.pop(recs[cnt])) {
      iov[cnt] = {recs[cnt].buf, recs[cnt].len};
      ++cnt;
      if (cnt == kBatch) {
        WriteBatch(e, iov, cnt);
        cnt = 0;
        wrote = true;
      }
    }
    if (cnt > 0) {
      WriteBatch(e, iov, cnt);
      wrote = true;
    }
    return wrote;
  }

  static void WriteBatch(Entry &e, struct iovec *iov, int cnt) {
    if (e.fd == -1) {
      return;
    }
    if (!io::WritevAll(e.fd, iov, cnt)) {
      Error("audit", "", "writev", std::strerror(errno));
      CloseEntry(e);
    }
  }

  std::string dir_;
  std::mutex mu_;
  std::vector<Entry> entries_;
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

} // namespace logging
