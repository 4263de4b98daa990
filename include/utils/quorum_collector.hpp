#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hierfed {

enum class CollectOutcome {
  Accepted,
  Stale,     // message belongs to a round that is not open
  Duplicate  // sender already delivered for this round
};

// Bounded-wait collection of one message per sender for a single round.
// Producers call offer() from request threads; the round thread blocks in
// waitFor() until `count` messages arrived or the deadline fires.
template <typename T>
class QuorumCollector {
public:
  // Opens collection for `round`, dropping anything held for an older round
  void open(uint64_t round) {
    std::lock_guard<std::mutex> lock(mutex_);
    round_ = round;
    open_ = true;
    items_.clear();
    cv_.notify_all();
  }

  // Stops accepting; later offers for the same round are stale
  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    cv_.notify_all();
  }

  CollectOutcome offer(uint64_t round, const std::string &sender, T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_ || round != round_) {
      return CollectOutcome::Stale;
    }
    if (items_.count(sender) != 0) {
      return CollectOutcome::Duplicate;
    }
    items_.emplace(sender, std::move(item));
    cv_.notify_all();
    return CollectOutcome::Accepted;
  }

  // Returns true when at least `count` items are held; false on deadline or
  // when the collector is closed first
  bool waitFor(size_t count, std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline,
                   [&] { return !open_ || items_.size() >= count; });
    return items_.size() >= count;
  }

  std::vector<T> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    out.reserve(items_.size());
    for (const auto &[sender, item] : items_) {
      out.push_back(item);
    }
    return out;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  uint64_t round() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return round_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  uint64_t round_ = 0;
  bool open_ = false;
  // Ordered by sender so snapshots are deterministic
  std::map<std::string, T> items_;
};

} // namespace hierfed
