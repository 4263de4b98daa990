#include "utils/background_tasks.hpp"
#include <chrono>
#include <future>
#include <gtest/gtest.h>

using namespace hierfed;
using namespace std::chrono_literals;

class BackgroundTasksTest : public ::testing::Test {
protected:
  // Spins until every spawned task has set its flag or a second passes
  void waitForCount(const std::atomic<int> &count, int expected) {
    auto give_up = std::chrono::steady_clock::now() + 1s;
    while (count.load() < expected && std::chrono::steady_clock::now() < give_up) {
      std::this_thread::sleep_for(1ms);
    }
  }

  BackgroundTasks tasks_;
};

TEST_F(BackgroundTasksTest, FinishedTasksAreJoinedOnNextSpawn) {
  std::atomic<int> finished{0};
  for (int i = 0; i < 5; ++i) {
    tasks_.spawn([&finished] { ++finished; });
    waitForCount(finished, i + 1);
    std::this_thread::sleep_for(5ms);
    // Each spawn joins the previous, already finished task
    EXPECT_LE(tasks_.size(), 2u);
  }
  ASSERT_EQ(finished.load(), 5);
  std::this_thread::sleep_for(10ms);
  tasks_.reap();
  EXPECT_EQ(tasks_.size(), 0u);
}

TEST_F(BackgroundTasksTest, RunningTasksAreKept) {
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<int> finished{0};

  tasks_.spawn([gate, &finished] {
    gate.wait();
    ++finished;
  });
  tasks_.spawn([&finished] { ++finished; });
  waitForCount(finished, 1);
  std::this_thread::sleep_for(10ms);

  EXPECT_EQ(tasks_.reap(), 1u);
  EXPECT_EQ(tasks_.size(), 1u);

  release.set_value();
  tasks_.joinAll();
  EXPECT_EQ(finished.load(), 2);
  EXPECT_EQ(tasks_.size(), 0u);
}
