#pragma once
#include "crypto/cp_abe.hpp"
#include "protocol/messages.hpp"
#include "utils/error_codes.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hierfed {

// Peers that answered the readiness handshake
struct PeerReadiness {
  std::vector<std::string> facilities;
  std::map<std::string, std::string> fog_keys;       // fog id -> Ed25519 key
  std::map<std::string, std::string> validator_keys; // validator id -> key
};

// Everything the round coordinator needs from the other tiers. The HTTP
// implementation lives in LeaderServer; tests substitute in-process fakes.
class RoundTransport {
public:
  virtual ~RoundTransport() = default;

  virtual PeerReadiness checkReadiness() = 0;

  // Facility ids the TA currently lists as registered; revoked ones are absent
  virtual Result<std::vector<std::string>> registeredFacilities() = 0;

  // Tells the ready fog nodes and the selected facilities. Delivery is
  // retried until the announcement's collection deadline.
  virtual void announceRound(const RoundAnnouncement &announcement,
                             const PeerReadiness &peers) = 0;

  // Sends the candidate to every ready validator and hands each returned
  // vote to `deliver`; returns once all answered or the deadline passed
  virtual void requestVotes(const ValidationRequest &request,
                            const PeerReadiness &peers,
                            std::chrono::steady_clock::time_point deadline,
                            const std::function<void(const Vote &)> &deliver) = 0;

  virtual Result<AttributePublicParams> fetchPublicParams() = 0;

  virtual void publishModel(const EncryptedModel &model) = 0;
};

} // namespace hierfed
