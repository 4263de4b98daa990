#include "facility/facility.hpp"
#include "crypto/proof_of_work.hpp"
#include "crypto/signature.hpp"
#include "mpc/shamir_aggregation.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace hierfed {

Facility::Facility(const DeploymentConfig &config, const Endpoint &self,
                   std::unique_ptr<TrainingModule> training)
    : self_(self), difficulty_bits_(config.pow_difficulty_bits),
      dp_enabled_(config.dp_enabled), training_(std::move(training)),
      aggregation_(std::make_unique<ShamirAggregationModule>(
          config.reconstruction_threshold, config.fogCount(),
          config.min_participants)) {
  for (const auto &fog : config.registry.fog_nodes) {
    fog_ids_.push_back(fog.id);
  }
  if (dp_enabled_) {
    mechanism_.emplace(config.dp_epsilon, config.dp_delta, config.dp_clip_norm);
  }
  auto keypair = SignatureUtils::generateKeyPair();
  public_key_ = keypair.first;
  private_key_ = keypair.second;

  model_.version = 1;
  model_.parameters = config.initial_parameters;

  DEBUG_INFO("Facility " << self_.id << " initialized with Ed25519 public key: "
                         << public_key_);
}

Result<RegistrationRequest>
Facility::solveChallenge(const ChallengeResponse &challenge) const {
  if (challenge.facility_id != self_.id) {
    return Result<RegistrationRequest>(ErrorCode::RegistrationRejected,
                                       "challenge issued to " +
                                           challenge.facility_id);
  }
  int bits = std::max(challenge.difficulty_bits, difficulty_bits_);
  auto nonce = PowPuzzle::solve(self_.id, challenge.challenge, bits);
  if (!nonce) {
    return Result<RegistrationRequest>(ErrorCode::RegistrationInvalidProof,
                                       "no nonce found");
  }
  return RegistrationRequest{self_.id, public_key_, self_.attributes,
                             challenge.challenge, *nonce};
}

Result<void> Facility::acceptIdentity(const Identity &identity,
                                      const std::string &ta_public_key) {
  if (identity.facility_id != self_.id || identity.public_key != public_key_) {
    return Result<void>(ErrorCode::RegistrationRejected,
                        "identity does not belong to this facility");
  }
  if (!SignatureUtils::verifySignature(identityMessage(identity),
                                       identity.ta_signature, ta_public_key)) {
    return Result<void>(ErrorCode::CryptoInvalidSignature,
                        "identity not signed by the trusted authority");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  identity_ = identity;
  LOG("Facility " << self_.id << " holds identity at key epoch "
                  << identity.key_epoch << " with "
                  << identity.attribute_keys.size() << " attribute keys");
  return Result<void>();
}

bool Facility::isRegistered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return identity_.has_value() && identity_->registered;
}

std::optional<Identity> Facility::identity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return identity_;
}

RefreshKeysRequest Facility::signedRefreshRequest() const {
  RefreshKeysRequest request{self_.id, unixMillis(), ""};
  request.signature =
      SignatureUtils::createSignature(refreshKeysMessage(request), private_key_);
  return request;
}

void Facility::setLocalData(std::string payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  local_data_ = std::move(payload);
}

Result<void> Facility::announceRound(const RoundAnnouncement &announcement) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (round_ && announcement.round <= round_->round) {
    return Result<void>(ErrorCode::ProtocolStaleMessage,
                        "round " + std::to_string(announcement.round) +
                            " is not newer than " +
                            std::to_string(round_->round));
  }
  round_ = announcement;
  DEBUG_INFO("Facility " << self_.id << " received announcement for round "
                         << announcement.round);
  return Result<void>();
}

bool Facility::readyToContribute() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!identity_ || !identity_->registered || !round_ || !local_data_) {
    return false;
  }
  if (contributed_round_ >= round_->round) {
    return false;
  }
  const auto &participants = round_->participants;
  return std::find(participants.begin(), participants.end(), self_.id) !=
         participants.end();
}

std::optional<RoundAnnouncement> Facility::currentRound() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return round_;
}

Result<std::vector<ShareMessage>> Facility::prepareContribution() {
  using R = Result<std::vector<ShareMessage>>;
  std::lock_guard<std::mutex> lock(mutex_);

  if (!identity_ || !identity_->registered) {
    return R(ErrorCode::ProtocolNotReady, "facility is not registered");
  }
  if (!round_ || contributed_round_ >= round_->round) {
    return R(ErrorCode::RoundNotActive, "no announced round awaiting data");
  }
  if (!local_data_) {
    return R(ErrorCode::ProtocolNotReady, "no local data for this round");
  }
  const RoundAnnouncement &round = *round_;
  if (std::find(round.participants.begin(), round.participants.end(),
                self_.id) == round.participants.end()) {
    return R(ErrorCode::RoundNotActive, "facility not selected for round " +
                                            std::to_string(round.round));
  }
  // Shares go only to the listed fogs, which must still reach the threshold
  std::set<int> recipients;
  for (const auto &fog_id : round.fog_nodes) {
    auto it = std::find(fog_ids_.begin(), fog_ids_.end(), fog_id);
    if (it == fog_ids_.end()) {
      return R(ErrorCode::AggregationInvalidData,
               "round lists unknown fog node " + fog_id);
    }
    recipients.insert(static_cast<int>(it - fog_ids_.begin()));
  }
  if (static_cast<int>(recipients.size()) <
      aggregation_->getProtocolMetadata().threshold) {
    return R(ErrorCode::AggregationInvalidData,
             "round lists " + std::to_string(recipients.size()) +
                 " fog nodes, below the reconstruction threshold");
  }

  auto local = training_->train(round.global_parameters, *local_data_);
  if (!local) {
    return R(local.error(), local.message());
  }
  if (local.value().size() != round.global_parameters.size()) {
    return R(ErrorCode::AggregationDimensionMismatch,
             "training returned " + std::to_string(local.value().size()) +
                 " parameters");
  }

  std::vector<double> update_delta(local.value().size());
  for (size_t i = 0; i < update_delta.size(); ++i) {
    update_delta[i] = local.value()[i] - round.global_parameters[i];
    if (!std::isfinite(update_delta[i])) {
      return R(ErrorCode::AggregationInvalidData, "non-finite local update");
    }
  }

  // Spend before noising so a failure later can never lead to a second draw
  auto spend = ledger_.spend(round.round,
                             dp_enabled_ ? mechanism_->epsilon() : 0.0,
                             dp_enabled_ ? mechanism_->delta() : 0.0);
  if (!spend) {
    return R(spend.error(), spend.message());
  }

  std::vector<double> noised = round.global_parameters;
  std::vector<double> released =
      dp_enabled_ ? mechanism_->privatize(update_delta) : update_delta;
  for (size_t i = 0; i < noised.size(); ++i) {
    noised[i] += released[i];
  }

  auto shares = aggregation_->shardUpdate(noised);
  if (!shares) {
    return R(shares.error(), shares.message());
  }

  Identity public_id = publicIdentity(*identity_);
  std::vector<ShareMessage> messages;
  for (size_t j = 0; j < shares.value().size(); ++j) {
    if (recipients.count(static_cast<int>(j)) == 0) {
      continue;
    }
    ShareMessage message;
    message.round = round.round;
    message.facility_id = self_.id;
    message.fog_index = static_cast<int>(j);
    message.x = shares.value()[j].x;
    message.values = std::move(shares.value()[j].values);
    message.identity = public_id;
    message.signature = SignatureUtils::createSignature(
        shareSigningMessage(message), private_key_);
    messages.push_back(std::move(message));
  }

  contributed_round_ = round.round;
  local_data_.reset();
  LOG("Facility " << self_.id << " prepared " << messages.size()
                  << " shares for round " << round.round);
  return messages;
}

Result<ModelView> Facility::receiveModel(const EncryptedModel &model) {
  using R = Result<ModelView>;
  std::vector<AttributeKey> keys;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!identity_) {
      return R(ErrorCode::ProtocolNotReady, "facility is not registered");
    }
    if (model.version <= model_.version) {
      return R(ErrorCode::ProtocolStaleMessage,
               "model version " + std::to_string(model.version) +
                   " is not newer than " + std::to_string(model_.version));
    }
    keys = identity_->attribute_keys;
  }

  auto plaintext = CpAbe::decrypt(model.payload, keys);
  if (!plaintext) {
    DEBUG_WARN("Facility " << self_.id << " could not decrypt model v"
                           << model.version << ": " << plaintext.message());
    return R(plaintext.error(), plaintext.message());
  }

  ModelView view;
  try {
    auto body = nlohmann::json::parse(plaintext.value());
    body.at("version").get_to(view.version);
    body.at("parameters").get_to(view.parameters);
  } catch (const nlohmann::json::exception &e) {
    return R(ErrorCode::CryptoDecryptionFailed,
             std::string("model plaintext is malformed: ") + e.what());
  }
  if (view.version != model.version) {
    return R(ErrorCode::CryptoDecryptionFailed,
             "sealed version does not match envelope");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  model_ = view;
  LOG("Facility " << self_.id << " installed global model v" << view.version);
  return view;
}

ModelView Facility::model() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return model_;
}

} // namespace hierfed
