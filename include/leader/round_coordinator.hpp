#pragma once
#include "config/deployment_config.hpp"
#include "leader/round_state.hpp"
#include "leader/round_transport.hpp"
#include "mpc/aggregation_module.hpp"
#include "protocol/messages.hpp"
#include "utils/error_codes.hpp"
#include "utils/quorum_collector.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hierfed {

// Drives the round state machine. Only one round runs at a time; partial
// sums and votes arrive concurrently through acceptPartialSum/acceptVote.
class RoundCoordinator {
public:
  RoundCoordinator(const DeploymentConfig &config, RoundTransport &transport);

  // Runs one complete round. Returns the new model version, or the abort
  // reason with the model left unchanged.
  Result<uint64_t> runRound();

  Result<void> acceptPartialSum(const FogPartialSum &partial);
  Result<void> acceptVote(const Vote &vote);

  bool isRoundInFlight() const;

  RoundState state() const;
  RoundStatus status() const;
  GlobalModel globalModel() const;
  std::optional<EncryptedModel> encryptedModel() const;

private:
  // Forward-only within a round; Idle ends it
  void transition(RoundState next);
  Result<uint64_t> abort(ErrorCode code, const std::string &reason);

  // Largest participant set covered by >= t partial sums, first t by fog index
  std::optional<std::vector<FogPartialSum>>
  selectPartialGroup(const std::vector<FogPartialSum> &partials) const;

  Result<uint64_t> finalize(const CandidateAggregate &candidate);

  DeploymentConfig config_;
  RoundTransport &transport_;
  std::unique_ptr<AggregationModule> aggregation_;

  // Held for the whole of runRound()
  std::mutex round_mutex_;

  mutable std::mutex state_mutex_;
  RoundState state_ = RoundState::Idle;
  uint64_t round_ = 0;
  std::vector<std::string> participants_;
  PeerReadiness peers_;
  GlobalModel model_;
  std::optional<EncryptedModel> encrypted_;
  std::string last_outcome_;

  QuorumCollector<FogPartialSum> partials_;
  QuorumCollector<Vote> votes_;
};

} // namespace hierfed
