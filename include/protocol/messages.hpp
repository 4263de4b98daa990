#pragma once
#include "crypto/cp_abe.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hierfed {

// ===== Registration =====

struct ChallengeResponse {
  std::string facility_id;
  std::string challenge;
  int difficulty_bits = 0;
};

struct RegistrationRequest {
  std::string facility_id;
  std::string public_key; // facility Ed25519 key, hex
  std::vector<std::string> attributes;
  std::string challenge;
  uint64_t nonce = 0;
};

// TA-issued identity. attribute_keys carry secret keys only when returned to
// the owning facility.
struct Identity {
  std::string facility_id;
  std::string public_key;
  std::vector<std::string> attributes;
  std::vector<AttributeKey> attribute_keys;
  uint64_t key_epoch = 0;
  int64_t issued_at = 0; // unix ms
  bool registered = false;
  std::string ta_signature;
};

struct RefreshKeysRequest {
  std::string facility_id;
  int64_t timestamp_ms = 0;
  std::string signature; // by the facility key over refreshKeysMessage()
};

struct RevokeRequest {
  std::string facility_id;
};

// Body of the TA's /facilities listing; attribute secrets are stripped
struct FacilityList {
  std::vector<Identity> facilities;
};

struct PublicParams {
  std::string ta_public_key;
  int difficulty_bits = 0;
  AttributePublicParams attributes;
};

// ===== Round =====

struct RoundAnnouncement {
  uint64_t round = 0;
  uint64_t base_version = 0;
  int threshold = 0;
  std::vector<std::string> participants; // facility ids expected this round
  std::vector<std::string> fog_nodes;    // fog ids; index i evaluates x = i + 1
  std::vector<double> global_parameters;
  int64_t collection_deadline_ms = 0; // unix ms
  int64_t reconstruction_deadline_ms = 0;
  int64_t voting_deadline_ms = 0;
};

struct ShareMessage {
  uint64_t round = 0;
  std::string facility_id;
  int fog_index = 0;
  uint64_t x = 0;
  std::vector<uint64_t> values;
  Identity identity; // without attribute keys
  std::string signature;
};

struct FogPartialSum {
  uint64_t round = 0;
  std::string fog_id;
  int fog_index = 0;
  uint64_t x = 0;
  std::vector<std::string> participants; // sorted
  std::vector<uint64_t> values;
  std::string signature;
};

struct CandidateAggregate {
  uint64_t round = 0;
  uint64_t base_version = 0;
  std::vector<std::string> participants;
  std::vector<double> parameters;
  std::string hash;
};

struct ValidationRequest {
  CandidateAggregate candidate;
  std::vector<double> base_parameters;
};

struct Vote {
  std::string validator_id;
  uint64_t round = 0;
  std::string candidate_hash;
  bool accept = false;
  std::string reason;
  std::string signature;
};

struct EncryptedModel {
  uint64_t version = 0;
  uint64_t round = 0;
  PolicyCiphertext payload;
};

// ===== Liveness / status =====

struct ReadyResponse {
  std::string role;
  std::string id;
  std::string public_key;
  bool ready = false;
};

struct RoundStatus {
  uint64_t round = 0;
  std::string state;
  uint64_t model_version = 0;
  std::vector<std::string> participants;
  size_t partial_sums = 0;
  size_t votes = 0;
  std::string last_outcome;
};

// ===== Canonical encodings =====

std::string identityMessage(const Identity &identity);
std::string refreshKeysMessage(const RefreshKeysRequest &request);
std::string shareSigningMessage(const ShareMessage &share);
std::string partialSumSigningMessage(const FogPartialSum &partial);
std::string voteSigningMessage(const Vote &vote);

// SHA-256 (hex) over round, base version, participants and the exact bit
// patterns of the parameters
std::string candidateHash(const CandidateAggregate &candidate);

// Copy of an identity safe to forward to third parties
Identity publicIdentity(const Identity &identity);

inline int64_t unixMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// Maps a unix-ms deadline onto the local steady clock
inline std::chrono::steady_clock::time_point steadyDeadline(int64_t unix_ms) {
  return std::chrono::steady_clock::now() +
         std::chrono::milliseconds(unix_ms - unixMillis());
}

// ===== JSON conversion =====

inline void to_json(nlohmann::json &j, const ChallengeResponse &c) {
  j = nlohmann::json{{"facility_id", c.facility_id},
                     {"challenge", c.challenge},
                     {"difficulty_bits", c.difficulty_bits}};
}

inline void from_json(const nlohmann::json &j, ChallengeResponse &c) {
  j.at("facility_id").get_to(c.facility_id);
  j.at("challenge").get_to(c.challenge);
  j.at("difficulty_bits").get_to(c.difficulty_bits);
}

inline void to_json(nlohmann::json &j, const RegistrationRequest &r) {
  j = nlohmann::json{{"facility_id", r.facility_id},
                     {"public_key", r.public_key},
                     {"attributes", r.attributes},
                     {"challenge", r.challenge},
                     {"nonce", r.nonce}};
}

inline void from_json(const nlohmann::json &j, RegistrationRequest &r) {
  j.at("facility_id").get_to(r.facility_id);
  j.at("public_key").get_to(r.public_key);
  j.at("attributes").get_to(r.attributes);
  j.at("challenge").get_to(r.challenge);
  j.at("nonce").get_to(r.nonce);
}

inline void to_json(nlohmann::json &j, const Identity &i) {
  j = nlohmann::json{{"facility_id", i.facility_id},
                     {"public_key", i.public_key},
                     {"attributes", i.attributes},
                     {"attribute_keys", i.attribute_keys},
                     {"key_epoch", i.key_epoch},
                     {"issued_at", i.issued_at},
                     {"registered", i.registered},
                     {"ta_signature", i.ta_signature}};
}

inline void from_json(const nlohmann::json &j, Identity &i) {
  j.at("facility_id").get_to(i.facility_id);
  j.at("public_key").get_to(i.public_key);
  j.at("attributes").get_to(i.attributes);
  i.attribute_keys = j.value("attribute_keys", std::vector<AttributeKey>{});
  j.at("key_epoch").get_to(i.key_epoch);
  j.at("issued_at").get_to(i.issued_at);
  j.at("registered").get_to(i.registered);
  j.at("ta_signature").get_to(i.ta_signature);
}

inline void to_json(nlohmann::json &j, const RefreshKeysRequest &r) {
  j = nlohmann::json{{"facility_id", r.facility_id},
                     {"timestamp_ms", r.timestamp_ms},
                     {"signature", r.signature}};
}

inline void from_json(const nlohmann::json &j, RefreshKeysRequest &r) {
  j.at("facility_id").get_to(r.facility_id);
  j.at("timestamp_ms").get_to(r.timestamp_ms);
  j.at("signature").get_to(r.signature);
}

inline void to_json(nlohmann::json &j, const RevokeRequest &r) {
  j = nlohmann::json{{"facility_id", r.facility_id}};
}

inline void from_json(const nlohmann::json &j, RevokeRequest &r) {
  j.at("facility_id").get_to(r.facility_id);
}

inline void to_json(nlohmann::json &j, const FacilityList &l) {
  j = nlohmann::json{{"facilities", l.facilities}};
}

inline void from_json(const nlohmann::json &j, FacilityList &l) {
  j.at("facilities").get_to(l.facilities);
}

inline void to_json(nlohmann::json &j, const PublicParams &p) {
  j = nlohmann::json{{"ta_public_key", p.ta_public_key},
                     {"difficulty_bits", p.difficulty_bits},
                     {"attributes", p.attributes}};
}

inline void from_json(const nlohmann::json &j, PublicParams &p) {
  j.at("ta_public_key").get_to(p.ta_public_key);
  j.at("difficulty_bits").get_to(p.difficulty_bits);
  j.at("attributes").get_to(p.attributes);
}

inline void to_json(nlohmann::json &j, const RoundAnnouncement &a) {
  j = nlohmann::json{{"round", a.round},
                     {"base_version", a.base_version},
                     {"threshold", a.threshold},
                     {"participants", a.participants},
                     {"fog_nodes", a.fog_nodes},
                     {"global_parameters", a.global_parameters},
                     {"collection_deadline_ms", a.collection_deadline_ms},
                     {"reconstruction_deadline_ms", a.reconstruction_deadline_ms},
                     {"voting_deadline_ms", a.voting_deadline_ms}};
}

inline void from_json(const nlohmann::json &j, RoundAnnouncement &a) {
  j.at("round").get_to(a.round);
  j.at("base_version").get_to(a.base_version);
  j.at("threshold").get_to(a.threshold);
  j.at("participants").get_to(a.participants);
  j.at("fog_nodes").get_to(a.fog_nodes);
  j.at("global_parameters").get_to(a.global_parameters);
  j.at("collection_deadline_ms").get_to(a.collection_deadline_ms);
  j.at("reconstruction_deadline_ms").get_to(a.reconstruction_deadline_ms);
  j.at("voting_deadline_ms").get_to(a.voting_deadline_ms);
}

inline void to_json(nlohmann::json &j, const ShareMessage &s) {
  j = nlohmann::json{{"round", s.round},
                     {"facility_id", s.facility_id},
                     {"fog_index", s.fog_index},
                     {"x", s.x},
                     {"values", s.values},
                     {"identity", s.identity},
                     {"signature", s.signature}};
}

inline void from_json(const nlohmann::json &j, ShareMessage &s) {
  j.at("round").get_to(s.round);
  j.at("facility_id").get_to(s.facility_id);
  j.at("fog_index").get_to(s.fog_index);
  j.at("x").get_to(s.x);
  j.at("values").get_to(s.values);
  j.at("identity").get_to(s.identity);
  j.at("signature").get_to(s.signature);
}

inline void to_json(nlohmann::json &j, const FogPartialSum &p) {
  j = nlohmann::json{{"round", p.round},
                     {"fog_id", p.fog_id},
                     {"fog_index", p.fog_index},
                     {"x", p.x},
                     {"participants", p.participants},
                     {"values", p.values},
                     {"signature", p.signature}};
}

inline void from_json(const nlohmann::json &j, FogPartialSum &p) {
  j.at("round").get_to(p.round);
  j.at("fog_id").get_to(p.fog_id);
  j.at("fog_index").get_to(p.fog_index);
  j.at("x").get_to(p.x);
  j.at("participants").get_to(p.participants);
  j.at("values").get_to(p.values);
  j.at("signature").get_to(p.signature);
}

inline void to_json(nlohmann::json &j, const CandidateAggregate &c) {
  j = nlohmann::json{{"round", c.round},
                     {"base_version", c.base_version},
                     {"participants", c.participants},
                     {"parameters", c.parameters},
                     {"hash", c.hash}};
}

inline void from_json(const nlohmann::json &j, CandidateAggregate &c) {
  j.at("round").get_to(c.round);
  j.at("base_version").get_to(c.base_version);
  j.at("participants").get_to(c.participants);
  j.at("parameters").get_to(c.parameters);
  j.at("hash").get_to(c.hash);
}

inline void to_json(nlohmann::json &j, const ValidationRequest &v) {
  j = nlohmann::json{{"candidate", v.candidate},
                     {"base_parameters", v.base_parameters}};
}

inline void from_json(const nlohmann::json &j, ValidationRequest &v) {
  j.at("candidate").get_to(v.candidate);
  j.at("base_parameters").get_to(v.base_parameters);
}

inline void to_json(nlohmann::json &j, const Vote &v) {
  j = nlohmann::json{{"validator_id", v.validator_id},
                     {"round", v.round},
                     {"candidate_hash", v.candidate_hash},
                     {"accept", v.accept},
                     {"reason", v.reason},
                     {"signature", v.signature}};
}

inline void from_json(const nlohmann::json &j, Vote &v) {
  j.at("validator_id").get_to(v.validator_id);
  j.at("round").get_to(v.round);
  j.at("candidate_hash").get_to(v.candidate_hash);
  j.at("accept").get_to(v.accept);
  v.reason = j.value("reason", std::string());
  j.at("signature").get_to(v.signature);
}

inline void to_json(nlohmann::json &j, const EncryptedModel &m) {
  j = nlohmann::json{{"version", m.version},
                     {"round", m.round},
                     {"policy", m.payload.policy},
                     {"key_epoch", m.payload.epoch},
                     {"wrapped_key", m.payload.wrapped_shares},
                     {"nonce", m.payload.nonce},
                     {"ciphertext", m.payload.ciphertext}};
}

inline void from_json(const nlohmann::json &j, EncryptedModel &m) {
  j.at("version").get_to(m.version);
  j.at("round").get_to(m.round);
  j.at("policy").get_to(m.payload.policy);
  j.at("key_epoch").get_to(m.payload.epoch);
  j.at("wrapped_key").get_to(m.payload.wrapped_shares);
  j.at("nonce").get_to(m.payload.nonce);
  j.at("ciphertext").get_to(m.payload.ciphertext);
}

inline void to_json(nlohmann::json &j, const ReadyResponse &r) {
  j = nlohmann::json{{"role", r.role},
                     {"id", r.id},
                     {"public_key", r.public_key},
                     {"ready", r.ready}};
}

inline void from_json(const nlohmann::json &j, ReadyResponse &r) {
  j.at("role").get_to(r.role);
  j.at("id").get_to(r.id);
  r.public_key = j.value("public_key", std::string());
  j.at("ready").get_to(r.ready);
}

inline void to_json(nlohmann::json &j, const RoundStatus &s) {
  j = nlohmann::json{{"round", s.round},
                     {"state", s.state},
                     {"model_version", s.model_version},
                     {"participants", s.participants},
                     {"partial_sums", s.partial_sums},
                     {"votes", s.votes},
                     {"last_outcome", s.last_outcome}};
}

inline void from_json(const nlohmann::json &j, RoundStatus &s) {
  j.at("round").get_to(s.round);
  j.at("state").get_to(s.state);
  j.at("model_version").get_to(s.model_version);
  j.at("participants").get_to(s.participants);
  j.at("partial_sums").get_to(s.partial_sums);
  j.at("votes").get_to(s.votes);
  s.last_outcome = j.value("last_outcome", std::string());
}

} // namespace hierfed
