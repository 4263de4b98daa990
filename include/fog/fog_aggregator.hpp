#pragma once
#include "config/deployment_config.hpp"
#include "mpc/aggregation_module.hpp"
#include "protocol/messages.hpp"
#include "utils/error_codes.hpp"
#include "utils/quorum_collector.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace hierfed {

// Tier-1 aggregator for one evaluation point. Accepts exactly one share per
// facility per round and emits a signed partial sum.
class FogAggregator {
public:
  FogAggregator(const DeploymentConfig &config, int index);

  const std::string &id() const { return self_.id; }
  int index() const { return index_; }
  uint64_t evaluationPoint() const { return static_cast<uint64_t>(index_) + 1; }
  const std::string &publicKey() const { return public_key_; }

  void setAuthorityKey(const std::string &ta_public_key);
  bool hasAuthorityKey() const;

  // Opens collection for a newer round
  Result<void> announceRound(const RoundAnnouncement &announcement);

  Result<void> acceptShare(const ShareMessage &share);

  // Blocks until every expected facility delivered or the deadline passes
  bool waitForShares(std::chrono::steady_clock::time_point deadline);

  // Sums what arrived, signs it and closes the round. A round is finalized
  // at most once; later calls are stale.
  Result<FogPartialSum> finalizeRound(uint64_t round);

  // Wakes any waiter without producing a partial sum
  void shutdown();

  std::optional<RoundAnnouncement> currentRound() const;
  size_t sharesReceived() const { return shares_.size(); }

private:
  Endpoint self_;
  int index_;
  std::unique_ptr<AggregationModule> aggregation_;

  std::string public_key_;
  std::string private_key_;

  mutable std::mutex mutex_;
  std::string ta_public_key_;
  std::optional<RoundAnnouncement> round_;
  std::set<std::string> expected_;
  uint64_t finalized_round_ = 0;

  QuorumCollector<ShareMessage> shares_;
};

} // namespace hierfed
