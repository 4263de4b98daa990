#include "fog/fog_aggregator.hpp"
#include "crypto/signature.hpp"
#include "mpc/shamir_aggregation.hpp"
#include "utils/logging.hpp"

namespace hierfed {

FogAggregator::FogAggregator(const DeploymentConfig &config, int index)
    : self_(config.registry.fog_nodes.at(index)), index_(index),
      aggregation_(std::make_unique<ShamirAggregationModule>(
          config.reconstruction_threshold, config.fogCount(),
          config.min_participants)) {
  auto keypair = SignatureUtils::generateKeyPair();
  public_key_ = keypair.first;
  private_key_ = keypair.second;
  DEBUG_INFO("Fog node " << self_.id << " evaluates x=" << evaluationPoint()
                         << ", Ed25519 public key: " << public_key_);
}

void FogAggregator::setAuthorityKey(const std::string &ta_public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  ta_public_key_ = ta_public_key;
}

bool FogAggregator::hasAuthorityKey() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !ta_public_key_.empty();
}

Result<void> FogAggregator::announceRound(const RoundAnnouncement &announcement) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (round_ && announcement.round <= round_->round) {
    return Result<void>(ErrorCode::ProtocolStaleMessage,
                        "round " + std::to_string(announcement.round) +
                            " is not newer than " +
                            std::to_string(round_->round));
  }
  round_ = announcement;
  expected_ = std::set<std::string>(announcement.participants.begin(),
                                    announcement.participants.end());
  shares_.open(announcement.round);
  DEBUG_INFO("Fog " << self_.id << " collecting round " << announcement.round
                    << " from " << expected_.size() << " facilities");
  return Result<void>();
}

Result<void> FogAggregator::acceptShare(const ShareMessage &share) {
  std::string ta_key;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // The share can overtake its round announcement; the sender retries
    if (!round_ || share.round > round_->round) {
      return Result<void>(ErrorCode::ProtocolNotReady,
                          "round " + std::to_string(share.round) +
                              " has not been announced here yet");
    }
    if (share.round < round_->round || finalized_round_ >= share.round) {
      DEBUG_DEBUG("Dropping stale share from " << share.facility_id
                                               << " for round " << share.round);
      return Result<void>(ErrorCode::ProtocolStaleMessage,
                          "round " + std::to_string(share.round) +
                              " is not collecting");
    }
    if (expected_.count(share.facility_id) == 0) {
      return Result<void>(ErrorCode::ProtocolUnknownSender,
                          share.facility_id + " is not a participant");
    }
    if (share.values.size() != round_->global_parameters.size()) {
      return Result<void>(ErrorCode::AggregationDimensionMismatch,
                          "share has " + std::to_string(share.values.size()) +
                              " values");
    }
    ta_key = ta_public_key_;
  }

  if (ta_key.empty()) {
    return Result<void>(ErrorCode::ProtocolNotReady,
                        "authority key not yet known");
  }
  if (share.fog_index != index_ || share.x != evaluationPoint()) {
    return Result<void>(ErrorCode::ProtocolInvalidMessage,
                        "share addressed to x=" + std::to_string(share.x));
  }
  for (uint64_t v : share.values) {
    if (v >= PrimeField::MODULUS) {
      return Result<void>(ErrorCode::AggregationInvalidData,
                          "share value outside the field");
    }
  }

  const Identity &identity = share.identity;
  if (identity.facility_id != share.facility_id || !identity.registered) {
    return Result<void>(ErrorCode::ProtocolUnknownSender,
                        "identity does not match sender");
  }
  if (!SignatureUtils::verifySignature(identityMessage(identity),
                                       identity.ta_signature, ta_key)) {
    return Result<void>(ErrorCode::CryptoInvalidSignature,
                        "identity not issued by the trusted authority");
  }
  if (!SignatureUtils::verifySignature(shareSigningMessage(share),
                                       share.signature, identity.public_key)) {
    return Result<void>(ErrorCode::CryptoInvalidSignature,
                        "share signature does not verify");
  }

  switch (shares_.offer(share.round, share.facility_id, share)) {
  case CollectOutcome::Stale:
    return Result<void>(ErrorCode::ProtocolStaleMessage, "round closed");
  case CollectOutcome::Duplicate:
    return Result<void>(ErrorCode::ProtocolDuplicateMessage,
                        share.facility_id + " already delivered a share");
  case CollectOutcome::Accepted:
    break;
  }
  DEBUG_DEBUG("Fog " << self_.id << " accepted share from " << share.facility_id
                     << " (" << shares_.size() << " held)");
  return Result<void>();
}

bool FogAggregator::waitForShares(std::chrono::steady_clock::time_point deadline) {
  size_t expected;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    expected = expected_.size();
  }
  return shares_.waitFor(expected, deadline);
}

Result<FogPartialSum> FogAggregator::finalizeRound(uint64_t round) {
  using R = Result<FogPartialSum>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!round_ || round_->round != round || finalized_round_ >= round) {
    return R(ErrorCode::ProtocolStaleMessage,
             "round " + std::to_string(round) + " is not open");
  }
  finalized_round_ = round;
  shares_.close();

  std::vector<ShareMessage> received = shares_.snapshot();
  if (received.empty()) {
    LOG("Fog " << self_.id << " received no shares for round " << round);
    return R(ErrorCode::AggregationInsufficientShares, "no shares received");
  }

  FogPartialSum partial;
  partial.round = round;
  partial.fog_id = self_.id;
  partial.fog_index = index_;

  std::vector<Share> collected;
  for (const auto &message : received) {
    partial.participants.push_back(message.facility_id);
    collected.push_back(Share{message.x, message.values});
  }

  auto sum = aggregation_->computePartial(collected);
  if (!sum) {
    return R(sum.error(), sum.message());
  }
  partial.x = sum.value().x;
  partial.values = std::move(sum.value().values);
  partial.signature = SignatureUtils::createSignature(
      partialSumSigningMessage(partial), private_key_);

  LOG("Fog " << self_.id << " computed partial sum for round " << round
             << " over " << partial.participants.size() << " facilities");
  return partial;
}

void FogAggregator::shutdown() { shares_.close(); }

std::optional<RoundAnnouncement> FogAggregator::currentRound() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return round_;
}

} // namespace hierfed
