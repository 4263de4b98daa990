#pragma once
#include <string>
#include <utility>

namespace hierfed {

class SignatureUtils {
public:
    // Ed25519 signature operations using libsodium; keys and signatures are hex
    static std::string createSignature(const std::string& message, const std::string& private_key);
    static bool verifySignature(const std::string& message, const std::string& signature, const std::string& public_key);

    // Key generation
    static std::pair<std::string, std::string> generateKeyPair(); // Returns (public_key, private_key)

    static bool isValidPublicKey(const std::string& public_key);
};

} // namespace hierfed
