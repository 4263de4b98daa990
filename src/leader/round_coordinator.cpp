#include "leader/round_coordinator.hpp"
#include "crypto/signature.hpp"
#include "mpc/shamir_aggregation.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace hierfed {

RoundCoordinator::RoundCoordinator(const DeploymentConfig &config,
                                   RoundTransport &transport)
    : config_(config), transport_(transport),
      aggregation_(std::make_unique<ShamirAggregationModule>(
          config.reconstruction_threshold, config.fogCount(),
          config.min_participants)) {
  model_.version = 1;
  model_.parameters = config.initial_parameters;
  model_.access_policy = config.access_policy;
}

void RoundCoordinator::transition(RoundState next) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (next != RoundState::Idle && next <= state_) {
    DEBUG_ERROR("Refusing state regression " << roundStateToString(state_)
                                             << " -> "
                                             << roundStateToString(next));
    return;
  }
  DEBUG_INFO("Round " << round_ << ": " << roundStateToString(state_) << " -> "
                      << roundStateToString(next));
  state_ = next;
}

Result<uint64_t> RoundCoordinator::abort(ErrorCode code,
                                         const std::string &reason) {
  partials_.close();
  votes_.close();
  uint64_t round;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    round = round_;
    last_outcome_ = "aborted: " + reason;
  }
  transition(RoundState::Idle);
  LOG("Round " << round << " aborted (" << errorToString(code) << "): "
               << reason << "; model stays at v" << globalModel().version);
  return Result<uint64_t>(code, reason);
}

bool RoundCoordinator::isRoundInFlight() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_ != RoundState::Idle;
}

Result<uint64_t> RoundCoordinator::runRound() {
  std::unique_lock<std::mutex> round_lock(round_mutex_, std::try_to_lock);
  if (!round_lock.owns_lock()) {
    return Result<uint64_t>(ErrorCode::RoundInProgress,
                            "a round is already in flight");
  }

  uint64_t round;
  std::vector<double> base_parameters;
  uint64_t base_version;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    round = ++round_;
    participants_.clear();
    peers_ = PeerReadiness{};
    base_parameters = model_.parameters;
    base_version = model_.version;
  }
  LOG("Starting round " << round << " on model v" << base_version);

  // ===== Readiness handshake =====
  PeerReadiness peers = transport_.checkReadiness();
  std::sort(peers.facilities.begin(), peers.facilities.end());
  peers.facilities.erase(
      std::unique(peers.facilities.begin(), peers.facilities.end()),
      peers.facilities.end());

  // A revoked facility still answers /ready but must not be selected
  auto registered = transport_.registeredFacilities();
  if (!registered) {
    return abort(ErrorCode::RoundAborted,
                 "authority registry unavailable: " +
                     std::string(registered.message()));
  }
  std::set<std::string> registered_ids(registered.value().begin(),
                                       registered.value().end());
  peers.facilities.erase(
      std::remove_if(peers.facilities.begin(), peers.facilities.end(),
                     [&registered_ids](const std::string &id) {
                       if (registered_ids.count(id) != 0) {
                         return false;
                       }
                       DEBUG_INFO(id << " is ready but not registered");
                       return true;
                     }),
      peers.facilities.end());

  if (static_cast<int>(peers.facilities.size()) < config_.min_participants) {
    return abort(ErrorCode::RoundInsufficientParticipants,
                 std::to_string(peers.facilities.size()) +
                     " facilities ready, need " +
                     std::to_string(config_.min_participants));
  }
  if (static_cast<int>(peers.fog_keys.size()) < config_.reconstruction_threshold) {
    return abort(ErrorCode::RoundInsufficientPartialSums,
                 std::to_string(peers.fog_keys.size()) + " fog nodes ready, need " +
                     std::to_string(config_.reconstruction_threshold));
  }
  if (static_cast<int>(peers.validator_keys.size()) < config_.voteQuorum()) {
    return abort(ErrorCode::ConsensusInsufficientVotes,
                 std::to_string(peers.validator_keys.size()) +
                     " validators ready, need " +
                     std::to_string(config_.voteQuorum()));
  }

  // ===== Collecting =====
  auto now = std::chrono::steady_clock::now();
  auto collection_deadline =
      now + std::chrono::milliseconds(config_.collection_timeout_ms);
  auto reconstruction_deadline =
      collection_deadline +
      std::chrono::milliseconds(config_.reconstruction_timeout_ms);

  RoundAnnouncement announcement;
  announcement.round = round;
  announcement.base_version = base_version;
  announcement.threshold = config_.reconstruction_threshold;
  announcement.participants = peers.facilities;
  // Only ready fogs receive shares; registry order keeps their indices
  for (const auto &fog : config_.registry.fog_nodes) {
    if (peers.fog_keys.count(fog.id) != 0) {
      announcement.fog_nodes.push_back(fog.id);
    }
  }
  announcement.global_parameters = base_parameters;
  int64_t start_ms = unixMillis();
  announcement.collection_deadline_ms = start_ms + config_.collection_timeout_ms;
  announcement.reconstruction_deadline_ms =
      announcement.collection_deadline_ms + config_.reconstruction_timeout_ms;
  announcement.voting_deadline_ms =
      announcement.reconstruction_deadline_ms + config_.voting_timeout_ms;

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    participants_ = peers.facilities;
    peers_ = peers;
  }
  partials_.open(round);
  transition(RoundState::Collecting);
  transport_.announceRound(announcement, peers);

  // ===== FogReconstructing =====
  partials_.waitFor(1, collection_deadline);
  transition(RoundState::FogReconstructing);

  std::optional<std::vector<FogPartialSum>> group;
  const size_t fog_count = static_cast<size_t>(config_.fogCount());
  for (size_t k = 1; k <= fog_count; ++k) {
    if (!partials_.waitFor(k, reconstruction_deadline)) {
      break;
    }
    group = selectPartialGroup(partials_.snapshot());
    if (group) {
      break;
    }
  }
  partials_.close();
  if (!group) {
    group = selectPartialGroup(partials_.snapshot());
  }
  if (!group) {
    return abort(ErrorCode::RoundInsufficientPartialSums,
                 std::to_string(partials_.size()) +
                     " partial sums received, need " +
                     std::to_string(config_.reconstruction_threshold) +
                     " covering the same participant set");
  }

  std::vector<Share> shares;
  for (const auto &partial : *group) {
    shares.push_back(Share{partial.x, partial.values});
  }
  const std::vector<std::string> &covered = group->front().participants;
  auto average = aggregation_->aggregate(shares, covered.size());
  if (!average) {
    return abort(ErrorCode::RoundAborted,
                 "reconstruction failed: " + std::string(average.message()));
  }

  CandidateAggregate candidate;
  candidate.round = round;
  candidate.base_version = base_version;
  candidate.participants = covered;
  candidate.parameters = average.moveValue();
  candidate.hash = candidateHash(candidate);
  DEBUG_INFO("Reconstructed candidate for round "
             << round << " over " << covered.size() << " participants from "
             << group->size() << " partial sums, hash " << candidate.hash);

  // ===== Validating =====
  auto voting_deadline =
      std::chrono::steady_clock::now() +
      std::chrono::milliseconds(config_.voting_timeout_ms);
  votes_.open(round);
  transition(RoundState::Validating);
  transport_.requestVotes(ValidationRequest{candidate, base_parameters}, peers,
                          voting_deadline,
                          [this](const Vote &vote) {
                            auto accepted = acceptVote(vote);
                            if (!accepted) {
                              DEBUG_WARN("Vote from " << vote.validator_id
                                                      << " discarded: "
                                                      << accepted.message());
                            }
                          });
  votes_.waitFor(peers.validator_keys.size(), voting_deadline);
  votes_.close();

  int accepting = 0;
  std::vector<Vote> dissent;
  for (const auto &vote : votes_.snapshot()) {
    if (vote.accept && vote.candidate_hash == candidate.hash) {
      ++accepting;
    } else {
      dissent.push_back(vote);
    }
  }
  if (accepting < config_.voteQuorum()) {
    for (const auto &vote : dissent) {
      LOG("Round " << round << " dissent from " << vote.validator_id << ": "
                   << (vote.accept ? "accepted a different candidate"
                                   : vote.reason));
    }
    return abort(ErrorCode::ValidationRejected,
                 std::to_string(accepting) + " accepting votes, need " +
                     std::to_string(config_.voteQuorum()));
  }

  // ===== Finalizing / Broadcasting =====
  return finalize(candidate);
}

Result<uint64_t> RoundCoordinator::finalize(const CandidateAggregate &candidate) {
  transition(RoundState::Finalizing);

  auto params = transport_.fetchPublicParams();
  if (!params) {
    return abort(ErrorCode::RoundAborted,
                 "attribute public keys unavailable: " +
                     std::string(params.message()));
  }

  uint64_t version;
  std::string policy;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    version = model_.version + 1;
    policy = model_.access_policy;
  }

  nlohmann::json plaintext = {{"version", version},
                              {"parameters", candidate.parameters}};
  auto sealed = CpAbe::encrypt(plaintext.dump(), policy, params.value());
  if (!sealed) {
    return abort(ErrorCode::RoundAborted,
                 "model encryption failed: " + std::string(sealed.message()));
  }

  EncryptedModel encrypted{version, candidate.round, sealed.moveValue()};
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    model_.version = version;
    model_.parameters = candidate.parameters;
    encrypted_ = encrypted;
    last_outcome_ = "finalized v" + std::to_string(version);
  }
  LOG("Round " << candidate.round << " finalized: model v" << version
               << " over " << candidate.participants.size()
               << " participants, key epoch " << encrypted.payload.epoch);

  transition(RoundState::Broadcasting);
  transport_.publishModel(encrypted);
  transition(RoundState::Idle);
  return version;
}

std::optional<std::vector<FogPartialSum>> RoundCoordinator::selectPartialGroup(
    const std::vector<FogPartialSum> &partials) const {
  std::map<std::vector<std::string>, std::vector<FogPartialSum>> groups;
  for (const auto &partial : partials) {
    groups[partial.participants].push_back(partial);
  }

  const std::vector<FogPartialSum> *best = nullptr;
  for (const auto &[participants, members] : groups) {
    if (static_cast<int>(members.size()) < config_.reconstruction_threshold ||
        static_cast<int>(participants.size()) < config_.min_participants) {
      continue;
    }
    if (!best || participants.size() > best->front().participants.size()) {
      best = &members;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  // Arrival order varies between runs; fog index order does not
  std::vector<FogPartialSum> chosen = *best;
  std::sort(chosen.begin(), chosen.end(),
            [](const FogPartialSum &a, const FogPartialSum &b) {
              return a.fog_index < b.fog_index;
            });
  chosen.resize(static_cast<size_t>(config_.reconstruction_threshold));
  return chosen;
}

Result<void> RoundCoordinator::acceptPartialSum(const FogPartialSum &partial) {
  std::string fog_key;
  std::set<std::string> expected;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (partial.round != round_ ||
        (state_ != RoundState::Collecting &&
         state_ != RoundState::FogReconstructing)) {
      DEBUG_DEBUG("Dropping stale partial sum from " << partial.fog_id
                                                     << " for round "
                                                     << partial.round);
      return Result<void>(ErrorCode::ProtocolStaleMessage,
                          "round " + std::to_string(partial.round) +
                              " is not reconstructing");
    }
    auto key = peers_.fog_keys.find(partial.fog_id);
    if (key == peers_.fog_keys.end()) {
      return Result<void>(ErrorCode::ProtocolUnknownSender,
                          partial.fog_id + " is not a ready fog node");
    }
    fog_key = key->second;
    expected.insert(participants_.begin(), participants_.end());
  }

  if (partial.fog_index < 0 || partial.fog_index >= config_.fogCount() ||
      config_.registry.fog_nodes[partial.fog_index].id != partial.fog_id ||
      partial.x != static_cast<uint64_t>(partial.fog_index) + 1) {
    return Result<void>(ErrorCode::ProtocolInvalidMessage,
                        "evaluation point does not match " + partial.fog_id);
  }
  if (static_cast<int>(partial.values.size()) != config_.model_dimension) {
    return Result<void>(ErrorCode::AggregationDimensionMismatch,
                        "partial sum has " +
                            std::to_string(partial.values.size()) + " values");
  }
  if (partial.participants.empty() ||
      !std::is_sorted(partial.participants.begin(), partial.participants.end())) {
    return Result<void>(ErrorCode::ProtocolInvalidMessage,
                        "participant list must be sorted and non-empty");
  }
  for (const auto &id : partial.participants) {
    if (expected.count(id) == 0) {
      return Result<void>(ErrorCode::ProtocolInvalidMessage,
                          id + " was not announced for this round");
    }
  }
  if (!SignatureUtils::verifySignature(partialSumSigningMessage(partial),
                                       partial.signature, fog_key)) {
    return Result<void>(ErrorCode::CryptoInvalidSignature,
                        "partial sum signature does not verify");
  }

  switch (partials_.offer(partial.round, partial.fog_id, partial)) {
  case CollectOutcome::Stale:
    return Result<void>(ErrorCode::ProtocolStaleMessage, "round closed");
  case CollectOutcome::Duplicate:
    return Result<void>(ErrorCode::ProtocolDuplicateMessage,
                        partial.fog_id + " already sent a partial sum");
  case CollectOutcome::Accepted:
    break;
  }
  DEBUG_INFO("Partial sum from " << partial.fog_id << " for round "
                                 << partial.round << " over "
                                 << partial.participants.size()
                                 << " participants");
  return Result<void>();
}

Result<void> RoundCoordinator::acceptVote(const Vote &vote) {
  std::string validator_key;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (vote.round != round_ || state_ != RoundState::Validating) {
      return Result<void>(ErrorCode::ProtocolStaleMessage,
                          "round " + std::to_string(vote.round) +
                              " is not validating");
    }
    auto key = peers_.validator_keys.find(vote.validator_id);
    if (key == peers_.validator_keys.end()) {
      return Result<void>(ErrorCode::ProtocolUnknownSender,
                          vote.validator_id + " is not a ready validator");
    }
    validator_key = key->second;
  }

  if (!SignatureUtils::verifySignature(voteSigningMessage(vote), vote.signature,
                                       validator_key)) {
    return Result<void>(ErrorCode::CryptoInvalidSignature,
                        "vote signature does not verify");
  }

  switch (votes_.offer(vote.round, vote.validator_id, vote)) {
  case CollectOutcome::Stale:
    return Result<void>(ErrorCode::ProtocolStaleMessage, "voting closed");
  case CollectOutcome::Duplicate:
    return Result<void>(ErrorCode::ConsensusAlreadyVoted,
                        vote.validator_id + " already voted");
  case CollectOutcome::Accepted:
    break;
  }
  return Result<void>();
}

RoundState RoundCoordinator::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

RoundStatus RoundCoordinator::status() const {
  RoundStatus status;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    status.round = round_;
    status.state = std::string(roundStateToString(state_));
    status.model_version = model_.version;
    status.participants = participants_;
    status.last_outcome = last_outcome_;
  }
  status.partial_sums = partials_.size();
  status.votes = votes_.size();
  return status;
}

GlobalModel RoundCoordinator::globalModel() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return model_;
}

std::optional<EncryptedModel> RoundCoordinator::encryptedModel() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return encrypted_;
}

} // namespace hierfed
