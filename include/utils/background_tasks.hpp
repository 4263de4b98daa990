#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace hierfed {

// Threads owned by a long-lived service. Finished threads are joined whenever
// a new one is spawned, so the set only holds work that is still running.
class BackgroundTasks {
public:
  BackgroundTasks() = default;
  BackgroundTasks(const BackgroundTasks &) = delete;
  BackgroundTasks &operator=(const BackgroundTasks &) = delete;

  ~BackgroundTasks() { joinAll(); }

  template <typename Func> void spawn(Func &&func) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([done, work = std::forward<Func>(func)]() mutable {
      work();
      done->store(true);
    });
    std::lock_guard<std::mutex> lock(mutex_);
    reapLocked();
    tasks_.push_back(Task{std::move(thread), std::move(done)});
  }

  // Joins finished threads; returns how many were joined
  size_t reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reapLocked();
  }

  // Blocks until every thread has finished
  void joinAll() {
    std::vector<Task> tasks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      tasks.swap(tasks_);
    }
    for (auto &task : tasks) {
      if (task.thread.joinable()) {
        task.thread.join();
      }
    }
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
  }

private:
  struct Task {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  size_t reapLocked() {
    size_t joined = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
      if (it->done->load()) {
        it->thread.join();
        it = tasks_.erase(it);
        ++joined;
      } else {
        ++it;
      }
    }
    return joined;
  }

  mutable std::mutex mutex_;
  std::vector<Task> tasks_;
};

} // namespace hierfed
