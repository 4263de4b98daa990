#include "crypto/signature.hpp"
#include "crypto/digest.hpp"
#include "utils/logging.hpp"
#include <sodium.h>
#include <stdexcept>

namespace hierfed {

std::string SignatureUtils::createSignature(const std::string& message, const std::string& private_key) {
    ensureSodium();

    auto sk_bytes = fromHex(private_key);
    if (!sk_bytes || sk_bytes->size() != crypto_sign_SECRETKEYBYTES) {
        throw std::runtime_error("Invalid private key length");
    }

    Bytes signature(crypto_sign_BYTES);
    unsigned long long signature_len = 0;

    if (crypto_sign_detached(
        signature.data(), &signature_len,
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        sk_bytes->data()) != 0) {
        throw std::runtime_error("Failed to create signature");
    }
    sodium_memzero(sk_bytes->data(), sk_bytes->size());

    DEBUG_DEBUG("Created Ed25519 signature for message: " << message.substr(0, 50) << "...");
    return toHex(signature);
}

bool SignatureUtils::verifySignature(const std::string& message, const std::string& signature, const std::string& public_key) {
    try {
        ensureSodium();
    } catch (const std::exception& e) {
        DEBUG_ERROR("Failed to initialize libsodium for signature verification: " << e.what());
        return false;
    }

    auto pk_bytes = fromHex(public_key);
    if (!pk_bytes || pk_bytes->size() != crypto_sign_PUBLICKEYBYTES) {
        DEBUG_ERROR("Invalid public key length: " << public_key.length());
        return false;
    }

    auto sig_bytes = fromHex(signature);
    if (!sig_bytes || sig_bytes->size() != crypto_sign_BYTES) {
        DEBUG_ERROR("Invalid signature length: " << signature.length());
        return false;
    }

    int result = crypto_sign_verify_detached(
        sig_bytes->data(),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        pk_bytes->data());

    if (result == 0) {
        DEBUG_DEBUG("Ed25519 signature VALID for message: " << message.substr(0, 30) << "...");
        return true;
    }
    DEBUG_DEBUG("Ed25519 signature INVALID for message: " << message.substr(0, 30) << "...");
    return false;
}

std::pair<std::string, std::string> SignatureUtils::generateKeyPair() {
    ensureSodium();

    Bytes pk(crypto_sign_PUBLICKEYBYTES);
    Bytes sk(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(pk.data(), sk.data()) != 0) {
        throw std::runtime_error("Ed25519 key generation failed");
    }

    auto keypair = std::make_pair(toHex(pk), toHex(sk));
    sodium_memzero(sk.data(), sk.size());

    DEBUG_DEBUG("Generated new Ed25519 keypair");
    return keypair;
}

bool SignatureUtils::isValidPublicKey(const std::string& public_key) {
    auto pk_bytes = fromHex(public_key);
    return pk_bytes && pk_bytes->size() == crypto_sign_PUBLICKEYBYTES;
}

} // namespace hierfed
