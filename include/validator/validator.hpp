#pragma once
#include "config/deployment_config.hpp"
#include "protocol/messages.hpp"
#include "utils/error_codes.hpp"
#include <map>
#include <mutex>
#include <string>

namespace hierfed {

// Committee member. Checks a candidate aggregate against the previous model
// and casts exactly one signed vote per round.
class Validator {
public:
  Validator(const DeploymentConfig &config, int index);

  const std::string &id() const { return self_.id; }
  const std::string &publicKey() const { return public_key_; }

  // Re-sending the same candidate returns the vote already cast
  Result<Vote> validate(const ValidationRequest &request);

  // Empty when the candidate passes every check, otherwise the first failure
  std::string check(const ValidationRequest &request) const;

  size_t votesCast() const;

private:
  Endpoint self_;
  int model_dimension_;
  int min_participants_;
  double max_abs_parameter_;
  double max_update_norm_;

  std::string public_key_;
  std::string private_key_;

  mutable std::mutex mutex_;
  std::map<uint64_t, Vote> votes_;
};

} // namespace hierfed
