#include "authority/trusted_authority.hpp"
#include "crypto/digest.hpp"
#include "crypto/proof_of_work.hpp"
#include "crypto/signature.hpp"
#include "utils/logging.hpp"
#include <iterator>

namespace hierfed {

TrustedAuthority::TrustedAuthority(const DeploymentConfig &config)
    : difficulty_bits_(config.pow_difficulty_bits),
      challenge_ttl_(config.challenge_ttl_ms),
      attribute_universe_(config.attribute_universe.begin(),
                          config.attribute_universe.end()) {
  auto keypair = SignatureUtils::generateKeyPair();
  public_key_ = keypair.first;
  private_key_ = keypair.second;

  for (const auto &attribute : attribute_universe_) {
    attribute_keys_[attribute] = CpAbe::generateAttributeKey(attribute, epoch_);
  }

  LOG("Trusted authority initialized with Ed25519 public key: " << public_key_);
  DEBUG_INFO("Issued key pairs for " << attribute_keys_.size()
                                     << " attributes at epoch " << epoch_);
}

uint64_t TrustedAuthority::keyEpoch() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return epoch_;
}

size_t TrustedAuthority::openChallenges() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_challenges_.size();
}

void TrustedAuthority::sign(Identity &identity) const {
  identity.ta_signature =
      SignatureUtils::createSignature(identityMessage(identity), private_key_);
}

void TrustedAuthority::expireChallenges(Clock::time_point now) {
  for (auto it = open_challenges_.begin(); it != open_challenges_.end();) {
    if (it->second.expires <= now) {
      challenge_by_facility_.erase(it->second.facility_id);
      it = open_challenges_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = used_challenges_.begin(); it != used_challenges_.end();) {
    it = it->second <= now ? used_challenges_.erase(it) : std::next(it);
  }
}

Result<ChallengeResponse>
TrustedAuthority::issueChallenge(const std::string &facility_id) {
  if (facility_id.empty()) {
    return Result<ChallengeResponse>(ErrorCode::ProtocolInvalidMessage,
                                     "facility_id is required");
  }
  std::string challenge = toHex(randomBytes(16));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    expireChallenges(now);
    auto previous = challenge_by_facility_.find(facility_id);
    if (previous != challenge_by_facility_.end()) {
      open_challenges_.erase(previous->second);
    }
    open_challenges_[challenge] = OpenChallenge{facility_id, now + challenge_ttl_};
    challenge_by_facility_[facility_id] = challenge;
  }
  DEBUG_DEBUG("Issued challenge " << challenge << " to " << facility_id);
  return ChallengeResponse{facility_id, challenge, difficulty_bits_};
}

Result<Identity>
TrustedAuthority::registerFacility(const RegistrationRequest &request) {
  using R = Result<Identity>;
  std::lock_guard<std::mutex> lock(mutex_);

  auto now = Clock::now();
  expireChallenges(now);

  if (used_challenges_.count(request.challenge) != 0) {
    LOG("Registration rejected for " << request.facility_id
                                     << ": challenge already used");
    return R(ErrorCode::RegistrationProofReused,
             "challenge " + request.challenge + " was already used");
  }

  auto challenge_it = open_challenges_.find(request.challenge);
  if (challenge_it == open_challenges_.end()) {
    LOG("Registration rejected for " << request.facility_id
                                     << ": unknown or expired challenge");
    return R(ErrorCode::RegistrationUnknownChallenge,
             "challenge is unknown, expired or superseded");
  }
  if (challenge_it->second.facility_id != request.facility_id) {
    LOG("Registration rejected for " << request.facility_id
                                     << ": challenge bound to "
                                     << challenge_it->second.facility_id);
    return R(ErrorCode::RegistrationRejected,
             "challenge was issued to a different facility");
  }

  // One attempt per challenge, successful or not
  used_challenges_[request.challenge] = challenge_it->second.expires;
  challenge_by_facility_.erase(challenge_it->second.facility_id);
  open_challenges_.erase(challenge_it);

  if (revoked_.count(request.facility_id) != 0) {
    LOG("Registration rejected for " << request.facility_id << ": revoked");
    return R(ErrorCode::RegistrationRevoked,
             request.facility_id + " has been revoked");
  }
  if (identities_.count(request.facility_id) != 0) {
    LOG("Registration rejected for " << request.facility_id
                                     << ": duplicate facility id");
    return R(ErrorCode::RegistrationDuplicateFacility,
             request.facility_id + " is already registered");
  }
  if (!SignatureUtils::isValidPublicKey(request.public_key)) {
    LOG("Registration rejected for " << request.facility_id
                                     << ": malformed public key");
    return R(ErrorCode::RegistrationRejected, "malformed Ed25519 public key");
  }
  if (request.attributes.empty()) {
    return R(ErrorCode::RegistrationInvalidAttributes,
             "at least one attribute must be declared");
  }
  for (const auto &attribute : request.attributes) {
    if (attribute_universe_.count(attribute) == 0) {
      LOG("Registration rejected for " << request.facility_id
                                       << ": unknown attribute " << attribute);
      return R(ErrorCode::RegistrationInvalidAttributes,
               "attribute '" + attribute + "' is not in the attribute universe");
    }
  }
  if (!PowPuzzle::verify(request.facility_id, request.challenge, request.nonce,
                         difficulty_bits_)) {
    LOG("Registration rejected for " << request.facility_id
                                     << ": invalid proof of work");
    return R(ErrorCode::RegistrationInvalidProof,
             "hash does not meet difficulty " + std::to_string(difficulty_bits_));
  }

  Identity identity;
  identity.facility_id = request.facility_id;
  identity.public_key = request.public_key;
  std::set<std::string> unique(request.attributes.begin(),
                               request.attributes.end());
  identity.attributes.assign(unique.begin(), unique.end());
  identity.attribute_keys = keysFor(identity.attributes);
  identity.key_epoch = epoch_;
  identity.issued_at = unixMillis();
  identity.registered = true;
  sign(identity);

  identities_[identity.facility_id] = identity;
  LOG("Registered facility " << identity.facility_id << " with "
                             << identity.attributes.size() << " attributes");
  return identity;
}

std::vector<AttributeKey>
TrustedAuthority::keysFor(const std::vector<std::string> &attributes) const {
  std::vector<AttributeKey> keys;
  for (const auto &attribute : attributes) {
    auto it = attribute_keys_.find(attribute);
    if (it != attribute_keys_.end()) {
      keys.push_back(it->second);
    }
  }
  return keys;
}

void TrustedAuthority::rotateAttributes(const std::set<std::string> &attributes) {
  ++epoch_;
  for (auto &[attribute, key] : attribute_keys_) {
    if (attributes.count(attribute) != 0) {
      key = CpAbe::generateAttributeKey(attribute, epoch_);
    } else {
      key.epoch = epoch_;
    }
  }
  // Re-issue keys only to facilities that remain registered
  for (auto &[id, identity] : identities_) {
    if (identity.registered) {
      identity.attribute_keys = keysFor(identity.attributes);
      identity.key_epoch = epoch_;
    } else {
      identity.attribute_keys.clear();
    }
    sign(identity);
  }
}

Result<void> TrustedAuthority::revoke(const std::string &facility_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = identities_.find(facility_id);
  if (it == identities_.end()) {
    return Result<void>(ErrorCode::RegistrationNotFound,
                        facility_id + " is not registered");
  }
  if (!it->second.registered) {
    return Result<void>(ErrorCode::RegistrationRevoked,
                        facility_id + " is already revoked");
  }

  it->second.registered = false;
  revoked_.insert(facility_id);
  std::set<std::string> held(it->second.attributes.begin(),
                             it->second.attributes.end());
  rotateAttributes(held);

  LOG("Revoked facility " << facility_id << "; rotated " << held.size()
                          << " attribute keys, key epoch now " << epoch_);
  return Result<void>();
}

Result<Identity> TrustedAuthority::refreshKeys(const RefreshKeysRequest &request) {
  using R = Result<Identity>;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = identities_.find(request.facility_id);
  if (it == identities_.end()) {
    return R(ErrorCode::RegistrationNotFound,
             request.facility_id + " is not registered");
  }
  if (!it->second.registered) {
    return R(ErrorCode::RegistrationRevoked,
             request.facility_id + " has been revoked");
  }
  if (!SignatureUtils::verifySignature(refreshKeysMessage(request),
                                       request.signature,
                                       it->second.public_key)) {
    return R(ErrorCode::CryptoInvalidSignature,
             "refresh request not signed by the registered key");
  }
  DEBUG_DEBUG("Refreshed keys for " << request.facility_id << " at epoch "
                                    << epoch_);
  return it->second;
}

PublicParams TrustedAuthority::publicParams() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PublicParams params;
  params.ta_public_key = public_key_;
  params.difficulty_bits = difficulty_bits_;
  params.attributes.epoch = epoch_;
  for (const auto &[attribute, key] : attribute_keys_) {
    params.attributes.public_keys[attribute] = key.public_key;
  }
  return params;
}

std::vector<Identity> TrustedAuthority::facilities() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Identity> out;
  for (const auto &[id, identity] : identities_) {
    out.push_back(publicIdentity(identity));
  }
  return out;
}

} // namespace hierfed
