#include "utils/quorum_collector.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace hierfed;
using namespace std::chrono_literals;

class QuorumCollectorTest : public ::testing::Test {
protected:
  void SetUp() override { collector_.open(3); }

  QuorumCollector<int> collector_;
};

TEST_F(QuorumCollectorTest, OneItemPerSender) {
  EXPECT_EQ(collector_.offer(3, "a", 1), CollectOutcome::Accepted);
  EXPECT_EQ(collector_.offer(3, "a", 2), CollectOutcome::Duplicate);
  EXPECT_EQ(collector_.offer(3, "b", 3), CollectOutcome::Accepted);
  EXPECT_EQ(collector_.size(), 2u);
  EXPECT_EQ(collector_.snapshot(), (std::vector<int>{1, 3}));
}

TEST_F(QuorumCollectorTest, OtherRoundsAreStale) {
  EXPECT_EQ(collector_.offer(2, "a", 1), CollectOutcome::Stale);
  EXPECT_EQ(collector_.offer(4, "a", 1), CollectOutcome::Stale);
  collector_.close();
  EXPECT_EQ(collector_.offer(3, "a", 1), CollectOutcome::Stale);
}

TEST_F(QuorumCollectorTest, ReopenDropsPreviousRound) {
  collector_.offer(3, "a", 1);
  collector_.open(4);
  EXPECT_EQ(collector_.size(), 0u);
  EXPECT_EQ(collector_.round(), 4u);
  EXPECT_EQ(collector_.offer(4, "a", 1), CollectOutcome::Accepted);
}

TEST_F(QuorumCollectorTest, WaitTimesOutWithoutQuorum) {
  collector_.offer(3, "a", 1);
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(collector_.waitFor(2, start + 50ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(QuorumCollectorTest, WaitReturnsWhenProducersDeliver) {
  std::thread producer([this] {
    std::this_thread::sleep_for(20ms);
    collector_.offer(3, "a", 1);
    collector_.offer(3, "b", 2);
  });
  EXPECT_TRUE(collector_.waitFor(2, std::chrono::steady_clock::now() + 5s));
  producer.join();
}

TEST_F(QuorumCollectorTest, CloseWakesWaiter) {
  std::thread closer([this] {
    std::this_thread::sleep_for(20ms);
    collector_.close();
  });
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(collector_.waitFor(1, start + 5s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
  closer.join();
}
