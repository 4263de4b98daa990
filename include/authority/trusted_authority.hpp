#pragma once
#include "config/deployment_config.hpp"
#include "crypto/cp_abe.hpp"
#include "protocol/messages.hpp"
#include "utils/error_codes.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace hierfed {

// Root of trust: issues one-time PoW challenges, registers facilities,
// signs identities and owns the attribute key pairs behind model encryption.
class TrustedAuthority {
public:
  explicit TrustedAuthority(const DeploymentConfig &config);

  // At most one open challenge per facility; a new request replaces the old
  // one and unanswered challenges expire after challenge_ttl_ms
  Result<ChallengeResponse> issueChallenge(const std::string &facility_id);

  // Verifies the proof and issues an identity carrying the attribute secret
  // keys for the declared attributes
  Result<Identity> registerFacility(const RegistrationRequest &request);

  // Marks the facility revoked and rotates every attribute key it held
  Result<void> revoke(const std::string &facility_id);

  // Current identity and attribute keys for a registered facility; the
  // request must be signed with the facility's registered key
  Result<Identity> refreshKeys(const RefreshKeysRequest &request);

  PublicParams publicParams() const;

  // Registered and revoked identities without attribute secret keys
  std::vector<Identity> facilities() const;

  const std::string &publicKey() const { return public_key_; }
  uint64_t keyEpoch() const;
  size_t openChallenges() const;

private:
  using Clock = std::chrono::steady_clock;

  struct OpenChallenge {
    std::string facility_id;
    Clock::time_point expires;
  };

  // Caller must hold mutex_
  std::vector<AttributeKey> keysFor(const std::vector<std::string> &attributes) const;
  void rotateAttributes(const std::set<std::string> &attributes);
  void sign(Identity &identity) const;
  void expireChallenges(Clock::time_point now);

  int difficulty_bits_;
  std::chrono::milliseconds challenge_ttl_;
  std::set<std::string> attribute_universe_;

  std::string public_key_;
  std::string private_key_;

  mutable std::mutex mutex_;
  uint64_t epoch_ = 1;
  std::map<std::string, AttributeKey> attribute_keys_;
  std::map<std::string, OpenChallenge> open_challenges_;       // by challenge
  std::map<std::string, std::string> challenge_by_facility_;
  // Consumed challenges, remembered until they would have expired
  std::map<std::string, Clock::time_point> used_challenges_;
  std::map<std::string, Identity> identities_;
  std::set<std::string> revoked_;
};

} // namespace hierfed
