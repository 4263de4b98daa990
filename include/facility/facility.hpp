#pragma once
#include "config/deployment_config.hpp"
#include "facility/training_module.hpp"
#include "mpc/aggregation_module.hpp"
#include "privacy/gaussian_mechanism.hpp"
#include "protocol/messages.hpp"
#include "utils/error_codes.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hierfed {

// Decrypted global model as seen by a facility
struct ModelView {
  uint64_t version = 0;
  std::vector<double> parameters;
};

// Data-holding participant. Produces one privatized, secret-shared update per
// announced round and decrypts the global model with its attribute keys.
class Facility {
public:
  Facility(const DeploymentConfig &config, const Endpoint &self,
           std::unique_ptr<TrainingModule> training);

  const std::string &id() const { return self_.id; }
  const std::string &publicKey() const { return public_key_; }

  // ===== Registration =====

  // Solves the TA's puzzle and builds the registration request
  Result<RegistrationRequest> solveChallenge(const ChallengeResponse &challenge) const;

  // Stores an identity after checking the TA signature and that it is ours
  Result<void> acceptIdentity(const Identity &identity,
                              const std::string &ta_public_key);

  bool isRegistered() const;
  std::optional<Identity> identity() const;

  RefreshKeysRequest signedRefreshRequest() const;

  // ===== Rounds =====

  // Holds the payload for the current or next announced round
  void setLocalData(std::string payload);

  // Records a newer round; older or repeated announcements are stale
  Result<void> announceRound(const RoundAnnouncement &announcement);

  // Registered, selected for the announced round, not yet contributed, and
  // local data is held
  bool readyToContribute() const;

  // Trains, clips and noises the update, splits it into one signed share per
  // fog node listed in the announcement and marks the round as contributed
  Result<std::vector<ShareMessage>> prepareContribution();

  std::optional<RoundAnnouncement> currentRound() const;

  // ===== Global model =====

  Result<ModelView> receiveModel(const EncryptedModel &model);
  ModelView model() const;

  const PrivacyLedger &ledger() const { return ledger_; }

private:
  Endpoint self_;
  std::vector<std::string> fog_ids_; // registry order gives the fog index
  int difficulty_bits_;
  bool dp_enabled_;
  std::optional<GaussianMechanism> mechanism_;
  std::unique_ptr<TrainingModule> training_;
  std::unique_ptr<AggregationModule> aggregation_;

  std::string public_key_;
  std::string private_key_;

  mutable std::mutex mutex_;
  std::optional<Identity> identity_;
  std::optional<RoundAnnouncement> round_;
  uint64_t contributed_round_ = 0;
  std::optional<std::string> local_data_;
  ModelView model_;
  PrivacyLedger ledger_;
};

} // namespace hierfed
