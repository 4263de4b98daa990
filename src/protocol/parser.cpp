#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <cstring>
#include <initializer_list>
#include <nlohmann/json.hpp>

namespace hierfed {

namespace {

template <typename T>
std::optional<T> parseMessage(const std::string &body, const char *name,
                              std::initializer_list<const char *> required) {
  try {
    DEBUG_DEBUG("Parsing " << name);
    nlohmann::json j = nlohmann::json::parse(body);

    // Validate Required Fields
    for (const char *field : required) {
      if (!j.contains(field)) {
        DEBUG_DEBUG("Missing required field '" << field << "' in " << name);
        return std::nullopt;
      }
    }

    return j.get<T>();

  } catch (const nlohmann::json::exception &e) {
    DEBUG_ERROR("JSON parsing error in " << name << ": " << e.what());
    return std::nullopt;
  }
}

} // namespace

std::optional<ChallengeResponse> parseChallengeResponse(const std::string &body) {
  return parseMessage<ChallengeResponse>(
      body, "ChallengeResponse", {"facility_id", "challenge", "difficulty_bits"});
}

std::optional<RegistrationRequest>
parseRegistrationRequest(const std::string &body) {
  return parseMessage<RegistrationRequest>(
      body, "RegistrationRequest",
      {"facility_id", "public_key", "attributes", "challenge", "nonce"});
}

std::optional<Identity> parseIdentity(const std::string &body) {
  return parseMessage<Identity>(body, "Identity",
                                {"facility_id", "public_key", "ta_signature"});
}

std::optional<RefreshKeysRequest>
parseRefreshKeysRequest(const std::string &body) {
  return parseMessage<RefreshKeysRequest>(
      body, "RefreshKeysRequest", {"facility_id", "timestamp_ms", "signature"});
}

std::optional<RevokeRequest> parseRevokeRequest(const std::string &body) {
  return parseMessage<RevokeRequest>(body, "RevokeRequest", {"facility_id"});
}

std::optional<PublicParams> parsePublicParams(const std::string &body) {
  return parseMessage<PublicParams>(body, "PublicParams",
                                    {"ta_public_key", "attributes"});
}

std::optional<FacilityList> parseFacilityList(const std::string &body) {
  return parseMessage<FacilityList>(body, "FacilityList", {"facilities"});
}

std::optional<RoundAnnouncement> parseRoundAnnouncement(const std::string &body) {
  return parseMessage<RoundAnnouncement>(
      body, "RoundAnnouncement",
      {"round", "participants", "fog_nodes", "collection_deadline_ms"});
}

std::optional<ShareMessage> parseShareMessage(const std::string &body) {
  return parseMessage<ShareMessage>(
      body, "ShareMessage",
      {"round", "facility_id", "x", "values", "identity", "signature"});
}

std::optional<FogPartialSum> parseFogPartialSum(const std::string &body) {
  return parseMessage<FogPartialSum>(
      body, "FogPartialSum",
      {"round", "fog_id", "x", "participants", "values", "signature"});
}

std::optional<ValidationRequest> parseValidationRequest(const std::string &body) {
  return parseMessage<ValidationRequest>(body, "ValidationRequest",
                                         {"candidate", "base_parameters"});
}

std::optional<Vote> parseVote(const std::string &body) {
  return parseMessage<Vote>(
      body, "Vote",
      {"validator_id", "round", "candidate_hash", "accept", "signature"});
}

std::optional<EncryptedModel> parseEncryptedModel(const std::string &body) {
  return parseMessage<EncryptedModel>(
      body, "EncryptedModel", {"version", "policy", "wrapped_key", "ciphertext"});
}

std::optional<ReadyResponse> parseReadyResponse(const std::string &body) {
  return parseMessage<ReadyResponse>(body, "ReadyResponse",
                                     {"role", "id", "ready"});
}

std::optional<std::vector<double>> parseFloat64Payload(const std::string &body) {
  if (body.size() % 8 != 0) {
    DEBUG_DEBUG("Float64 payload of " << body.size()
                                      << " bytes is not a multiple of 8");
    return std::nullopt;
  }
  std::vector<double> values(body.size() / 8);
  for (size_t i = 0; i < values.size(); ++i) {
    uint64_t bits = 0;
    for (int b = 7; b >= 0; --b) {
      bits = (bits << 8) | static_cast<unsigned char>(body[i * 8 + b]);
    }
    std::memcpy(&values[i], &bits, sizeof(bits));
  }
  return values;
}

std::string encodeFloat64Payload(const std::vector<double> &values) {
  std::string out(values.size() * 8, '\0');
  for (size_t i = 0; i < values.size(); ++i) {
    uint64_t bits;
    std::memcpy(&bits, &values[i], sizeof(bits));
    for (int b = 0; b < 8; ++b) {
      out[i * 8 + b] = static_cast<char>((bits >> (8 * b)) & 0xff);
    }
  }
  return out;
}

} // namespace hierfed
