#pragma once
#include "crypto/access_policy.hpp"
#include "utils/error_codes.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hierfed {

// X25519 key pair bound to one attribute for one TA key epoch (hex encoded)
struct AttributeKey {
  std::string attribute;
  uint64_t epoch = 0;
  std::string public_key;
  std::string secret_key; // empty in published parameters
};

// What the TA publishes: current public key of every attribute
struct AttributePublicParams {
  uint64_t epoch = 0;
  std::map<std::string, std::string> public_keys;
};

struct PolicyCiphertext {
  std::string policy;
  uint64_t epoch = 0;
  std::vector<std::string> wrapped_shares; // one sealed box per policy leaf, base64
  std::string nonce;                       // base64
  std::string ciphertext;                  // base64
};

// Ciphertext-policy encryption contract: a random content key encrypts the
// payload; the key is split down the policy tree (XOR shares under AND, copies
// under OR) and each leaf share is sealed to that attribute's public key.
// Holders of attribute secret keys that satisfy the policy recover the key.
class CpAbe {
public:
  static AttributeKey generateAttributeKey(const std::string &attribute,
                                           uint64_t epoch);

  static Result<PolicyCiphertext> encrypt(const std::string &plaintext,
                                          const std::string &policy,
                                          const AttributePublicParams &params);

  static Result<std::string> decrypt(const PolicyCiphertext &ciphertext,
                                     const std::vector<AttributeKey> &keys);
};

inline void to_json(nlohmann::json &j, const AttributeKey &k) {
  j = nlohmann::json{{"attribute", k.attribute},
                     {"epoch", k.epoch},
                     {"public_key", k.public_key}};
  if (!k.secret_key.empty()) {
    j["secret_key"] = k.secret_key;
  }
}

inline void from_json(const nlohmann::json &j, AttributeKey &k) {
  j.at("attribute").get_to(k.attribute);
  j.at("epoch").get_to(k.epoch);
  j.at("public_key").get_to(k.public_key);
  k.secret_key = j.value("secret_key", std::string());
}

inline void to_json(nlohmann::json &j, const AttributePublicParams &p) {
  j = nlohmann::json{{"epoch", p.epoch}, {"public_keys", p.public_keys}};
}

inline void from_json(const nlohmann::json &j, AttributePublicParams &p) {
  j.at("epoch").get_to(p.epoch);
  j.at("public_keys").get_to(p.public_keys);
}

inline void to_json(nlohmann::json &j, const PolicyCiphertext &c) {
  j = nlohmann::json{{"policy", c.policy},
                     {"epoch", c.epoch},
                     {"wrapped_shares", c.wrapped_shares},
                     {"nonce", c.nonce},
                     {"ciphertext", c.ciphertext}};
}

inline void from_json(const nlohmann::json &j, PolicyCiphertext &c) {
  j.at("policy").get_to(c.policy);
  j.at("epoch").get_to(c.epoch);
  j.at("wrapped_shares").get_to(c.wrapped_shares);
  j.at("nonce").get_to(c.nonce);
  j.at("ciphertext").get_to(c.ciphertext);
}

} // namespace hierfed
