#include "crypto/cp_abe.hpp"
#include "crypto/digest.hpp"
#include "utils/logging.hpp"
#include <functional>
#include <optional>
#include <sodium.h>
#include <stdexcept>

namespace hierfed {

namespace {

constexpr size_t kContentKeyBytes = crypto_secretbox_KEYBYTES;

Bytes xorBytes(const Bytes &a, const Bytes &b) {
  Bytes out(a.size());
  for (size_t i = 0; i < a.size(); ++i) {
    out[i] = a[i] ^ b[i];
  }
  return out;
}

} // namespace

AttributeKey CpAbe::generateAttributeKey(const std::string &attribute,
                                         uint64_t epoch) {
  ensureSodium();
  Bytes pk(crypto_box_PUBLICKEYBYTES);
  Bytes sk(crypto_box_SECRETKEYBYTES);
  if (crypto_box_keypair(pk.data(), sk.data()) != 0) {
    throw std::runtime_error("X25519 key generation failed for " + attribute);
  }
  AttributeKey key{attribute, epoch, toHex(pk), toHex(sk)};
  sodium_memzero(sk.data(), sk.size());
  return key;
}

Result<PolicyCiphertext> CpAbe::encrypt(const std::string &plaintext,
                                        const std::string &policy,
                                        const AttributePublicParams &params) {
  auto parsed = AccessPolicy::parse(policy);
  if (!parsed) {
    return Result<PolicyCiphertext>(parsed.error(), parsed.message());
  }
  ensureSodium();

  PolicyCiphertext out;
  out.policy = policy;
  out.epoch = params.epoch;

  // Split the content key down the tree; leaves are emitted depth-first
  std::string failure;
  std::function<bool(const PolicyNode &, const Bytes &)> wrap =
      [&](const PolicyNode &node, const Bytes &secret) -> bool {
    if (node.isLeaf()) {
      auto it = params.public_keys.find(node.attribute);
      auto pk = it == params.public_keys.end() ? std::nullopt : fromHex(it->second);
      if (!pk || pk->size() != crypto_box_PUBLICKEYBYTES) {
        failure = "no public key for attribute '" + node.attribute + "'";
        return false;
      }
      Bytes sealed(crypto_box_SEALBYTES + secret.size());
      if (crypto_box_seal(sealed.data(), secret.data(), secret.size(),
                          pk->data()) != 0) {
        failure = "sealing failed for attribute '" + node.attribute + "'";
        return false;
      }
      out.wrapped_shares.push_back(toBase64(sealed));
      return true;
    }
    if (node.isAnd()) {
      Bytes remainder = secret;
      for (size_t i = 0; i < node.children.size(); ++i) {
        Bytes share;
        if (i + 1 == node.children.size()) {
          share = remainder;
        } else {
          share = randomBytes(secret.size());
          remainder = xorBytes(remainder, share);
        }
        if (!wrap(*node.children[i], share)) {
          return false;
        }
      }
      return true;
    }
    if (node.threshold != 1) {
      failure = "unsupported threshold gate";
      return false;
    }
    for (const auto &child : node.children) {
      if (!wrap(*child, secret)) {
        return false;
      }
    }
    return true;
  };

  Bytes content_key = randomBytes(kContentKeyBytes);
  if (!wrap(*parsed.value().root(), content_key)) {
    sodium_memzero(content_key.data(), content_key.size());
    return Result<PolicyCiphertext>(ErrorCode::CryptoInvalidPolicy, failure);
  }

  Bytes nonce = randomBytes(crypto_secretbox_NONCEBYTES);
  Bytes sealed(crypto_secretbox_MACBYTES + plaintext.size());
  crypto_secretbox_easy(sealed.data(),
                        reinterpret_cast<const unsigned char *>(plaintext.data()),
                        plaintext.size(), nonce.data(), content_key.data());
  sodium_memzero(content_key.data(), content_key.size());

  out.nonce = toBase64(nonce);
  out.ciphertext = toBase64(sealed);
  DEBUG_DEBUG("Encrypted " << plaintext.size() << " bytes under policy '"
                           << policy << "' (" << out.wrapped_shares.size()
                           << " leaves, epoch " << out.epoch << ")");
  return out;
}

Result<std::string> CpAbe::decrypt(const PolicyCiphertext &ciphertext,
                                   const std::vector<AttributeKey> &keys) {
  auto parsed = AccessPolicy::parse(ciphertext.policy);
  if (!parsed) {
    return Result<std::string>(parsed.error(), parsed.message());
  }
  ensureSodium();

  bool epoch_match = false;
  for (const auto &key : keys) {
    if (key.epoch == ciphertext.epoch) {
      epoch_match = true;
    }
  }
  if (!epoch_match) {
    return Result<std::string>(ErrorCode::CryptoKeyEpochMismatch,
                               "no attribute keys for epoch " +
                                   std::to_string(ciphertext.epoch));
  }

  size_t leaf_index = 0;
  std::function<std::optional<Bytes>(const PolicyNode &)> unwrap =
      [&](const PolicyNode &node) -> std::optional<Bytes> {
    if (node.isLeaf()) {
      size_t index = leaf_index++;
      if (index >= ciphertext.wrapped_shares.size()) {
        return std::nullopt;
      }
      for (const auto &key : keys) {
        if (key.attribute != node.attribute || key.epoch != ciphertext.epoch) {
          continue;
        }
        auto pk = fromHex(key.public_key);
        auto sk = fromHex(key.secret_key);
        auto sealed = fromBase64(ciphertext.wrapped_shares[index]);
        if (!pk || !sk || !sealed || sealed->size() < crypto_box_SEALBYTES) {
          continue;
        }
        Bytes share(sealed->size() - crypto_box_SEALBYTES);
        if (crypto_box_seal_open(share.data(), sealed->data(), sealed->size(),
                                 pk->data(), sk->data()) == 0) {
          return share;
        }
      }
      return std::nullopt;
    }

    // Every child is visited so leaf indices stay aligned with encrypt()
    std::vector<std::optional<Bytes>> recovered;
    for (const auto &child : node.children) {
      recovered.push_back(unwrap(*child));
    }
    if (node.isAnd()) {
      Bytes combined;
      for (const auto &share : recovered) {
        if (!share) {
          return std::nullopt;
        }
        combined = combined.empty() ? *share : xorBytes(combined, *share);
      }
      return combined;
    }
    for (const auto &share : recovered) {
      if (share) {
        return share;
      }
    }
    return std::nullopt;
  };

  auto content_key = unwrap(*parsed.value().root());
  if (!content_key || content_key->size() != kContentKeyBytes) {
    return Result<std::string>(ErrorCode::CryptoPolicyNotSatisfied,
                               "attribute keys do not satisfy '" +
                                   ciphertext.policy + "'");
  }

  auto nonce = fromBase64(ciphertext.nonce);
  auto sealed = fromBase64(ciphertext.ciphertext);
  if (!nonce || nonce->size() != crypto_secretbox_NONCEBYTES || !sealed ||
      sealed->size() < crypto_secretbox_MACBYTES) {
    return Result<std::string>(ErrorCode::CryptoDecryptionFailed,
                               "malformed ciphertext");
  }

  std::string plaintext(sealed->size() - crypto_secretbox_MACBYTES, '\0');
  int rc = crypto_secretbox_open_easy(
      reinterpret_cast<unsigned char *>(plaintext.data()), sealed->data(),
      sealed->size(), nonce->data(), content_key->data());
  sodium_memzero(content_key->data(), content_key->size());
  if (rc != 0) {
    return Result<std::string>(ErrorCode::CryptoDecryptionFailed,
                               "authentication failed");
  }
  return plaintext;
}

} // namespace hierfed
