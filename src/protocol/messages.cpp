#include "protocol/messages.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace hierfed {

namespace {

template <typename T>
std::string joined(const std::vector<T> &items) {
  std::ostringstream os;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      os << ',';
    }
    os << items[i];
  }
  return os.str();
}

} // namespace

std::string identityMessage(const Identity &identity) {
  std::vector<std::string> attributes = identity.attributes;
  std::sort(attributes.begin(), attributes.end());
  return "identity|" + identity.facility_id + "|" + identity.public_key + "|" +
         joined(attributes) + "|" + std::to_string(identity.issued_at) + "|" +
         std::to_string(identity.key_epoch) + "|" +
         (identity.registered ? "registered" : "revoked");
}

std::string refreshKeysMessage(const RefreshKeysRequest &request) {
  return "refresh|" + request.facility_id + "|" +
         std::to_string(request.timestamp_ms);
}

std::string shareSigningMessage(const ShareMessage &share) {
  return "share|" + std::to_string(share.round) + "|" + share.facility_id +
         "|" + std::to_string(share.fog_index) + "|" + std::to_string(share.x) +
         "|" + joined(share.values);
}

std::string partialSumSigningMessage(const FogPartialSum &partial) {
  return "partial|" + std::to_string(partial.round) + "|" + partial.fog_id +
         "|" + std::to_string(partial.fog_index) + "|" +
         std::to_string(partial.x) + "|" + joined(partial.participants) + "|" +
         joined(partial.values);
}

std::string voteSigningMessage(const Vote &vote) {
  return "vote|" + vote.validator_id + "|" + std::to_string(vote.round) + "|" +
         vote.candidate_hash + "|" + (vote.accept ? "1" : "0") + "|" +
         vote.reason;
}

std::string candidateHash(const CandidateAggregate &candidate) {
  std::string encoded = "candidate|" + std::to_string(candidate.round) + "|" +
                        std::to_string(candidate.base_version) + "|" +
                        joined(candidate.participants) + "|";
  for (double value : candidate.parameters) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    unsigned char raw[8];
    for (int b = 0; b < 8; ++b) {
      raw[b] = static_cast<unsigned char>(bits >> (56 - 8 * b));
    }
    encoded += toHex(raw, sizeof(raw));
  }
  return sha256Hex(encoded);
}

Identity publicIdentity(const Identity &identity) {
  Identity copy = identity;
  copy.attribute_keys.clear();
  return copy;
}

} // namespace hierfed
