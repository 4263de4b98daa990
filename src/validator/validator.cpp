#include "validator/validator.hpp"
#include "crypto/signature.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <set>

namespace hierfed {

Validator::Validator(const DeploymentConfig &config, int index)
    : self_(config.registry.validators.at(index)),
      model_dimension_(config.model_dimension),
      min_participants_(config.min_participants),
      max_abs_parameter_(config.max_abs_parameter),
      max_update_norm_(config.max_update_norm) {
  auto keypair = SignatureUtils::generateKeyPair();
  public_key_ = keypair.first;
  private_key_ = keypair.second;
  DEBUG_INFO("Validator " << self_.id
                          << " initialized with Ed25519 public key: "
                          << public_key_);
}

std::string Validator::check(const ValidationRequest &request) const {
  const CandidateAggregate &candidate = request.candidate;

  if (static_cast<int>(candidate.parameters.size()) != model_dimension_) {
    return "shape: expected " + std::to_string(model_dimension_) +
           " parameters, got " + std::to_string(candidate.parameters.size());
  }
  if (request.base_parameters.size() != candidate.parameters.size()) {
    return "shape: base model has " +
           std::to_string(request.base_parameters.size()) + " parameters";
  }

  std::set<std::string> unique(candidate.participants.begin(),
                               candidate.participants.end());
  if (unique.size() != candidate.participants.size() ||
      static_cast<int>(unique.size()) < min_participants_) {
    return "participants: " + std::to_string(unique.size()) +
           " distinct, need " + std::to_string(min_participants_);
  }

  double drift = 0.0;
  for (size_t i = 0; i < candidate.parameters.size(); ++i) {
    double value = candidate.parameters[i];
    if (!std::isfinite(value) || !std::isfinite(request.base_parameters[i])) {
      return "finiteness: parameter " + std::to_string(i) + " is not finite";
    }
    if (std::fabs(value) > max_abs_parameter_) {
      return "magnitude: parameter " + std::to_string(i) + " exceeds " +
             std::to_string(max_abs_parameter_);
    }
    double d = value - request.base_parameters[i];
    drift += d * d;
  }
  drift = std::sqrt(drift);
  if (drift > max_update_norm_) {
    return "drift: update norm " + std::to_string(drift) + " exceeds " +
           std::to_string(max_update_norm_);
  }

  if (candidateHash(candidate) != candidate.hash) {
    return "hash: candidate hash does not match its contents";
  }
  return "";
}

Result<Vote> Validator::validate(const ValidationRequest &request) {
  using R = Result<Vote>;
  const uint64_t round = request.candidate.round;

  std::lock_guard<std::mutex> lock(mutex_);
  auto cast = votes_.find(round);
  if (cast != votes_.end()) {
    if (cast->second.candidate_hash == request.candidate.hash) {
      return cast->second;
    }
    return R(ErrorCode::ConsensusAlreadyVoted,
             self_.id + " already voted in round " + std::to_string(round));
  }
  if (!votes_.empty() && votes_.rbegin()->first > round) {
    return R(ErrorCode::ProtocolStaleMessage,
             "round " + std::to_string(round) + " is older than the last vote");
  }

  Vote vote;
  vote.validator_id = self_.id;
  vote.round = round;
  vote.candidate_hash = request.candidate.hash;
  vote.reason = check(request);
  vote.accept = vote.reason.empty();
  if (vote.accept) {
    vote.reason = "ok";
  }
  vote.signature =
      SignatureUtils::createSignature(voteSigningMessage(vote), private_key_);

  votes_.emplace(round, vote);
  LOG("Validator " << self_.id << " votes " << (vote.accept ? "ACCEPT" : "REJECT")
                   << " for round " << round << " (" << vote.reason << ")");
  return vote;
}

size_t Validator::votesCast() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return votes_.size();
}

} // namespace hierfed
