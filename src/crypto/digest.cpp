#include "crypto/digest.hpp"
#include <sodium.h>
#include <stdexcept>

namespace hierfed {

void ensureSodium() {
  // sodium_init() is idempotent and thread-safe; 1 means already initialized
  static const int status = sodium_init();
  if (status < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

std::string toHex(const unsigned char *data, size_t len) {
  std::string out(len * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), data, len);
  out.resize(len * 2);
  return out;
}

std::string toHex(const Bytes &data) { return toHex(data.data(), data.size()); }

std::optional<Bytes> fromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  Bytes out(hex.size() / 2);
  size_t written = 0;
  const char *end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr,
                     &written, &end) != 0 ||
      written != out.size() || end != hex.data() + hex.size()) {
    return std::nullopt;
  }
  return out;
}

std::string toBase64(const Bytes &data) {
  const int variant = sodium_base64_VARIANT_ORIGINAL;
  std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
  sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
  out.resize(out.find('\0'));
  return out;
}

std::optional<Bytes> fromBase64(std::string_view encoded) {
  Bytes out(encoded.size() / 4 * 3 + 3);
  size_t written = 0;
  const char *end = nullptr;
  if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                        nullptr, &written, &end,
                        sodium_base64_VARIANT_ORIGINAL) != 0 ||
      end != encoded.data() + encoded.size()) {
    return std::nullopt;
  }
  out.resize(written);
  return out;
}

Sha256Digest sha256(std::string_view data) {
  ensureSodium();
  Sha256Digest digest{};
  crypto_hash_sha256(digest.data(),
                     reinterpret_cast<const unsigned char *>(data.data()),
                     data.size());
  return digest;
}

std::string sha256Hex(std::string_view data) {
  auto digest = sha256(data);
  return toHex(digest.data(), digest.size());
}

int leadingZeroBits(const Sha256Digest &digest) {
  int bits = 0;
  for (unsigned char byte : digest) {
    if (byte == 0) {
      bits += 8;
      continue;
    }
    for (int bit = 7; bit >= 0; --bit) {
      if (byte & (1u << bit)) {
        return bits;
      }
      ++bits;
    }
  }
  return bits;
}

uint64_t randomWord() {
  ensureSodium();
  uint64_t word = 0;
  randombytes_buf(&word, sizeof(word));
  return word;
}

Bytes randomBytes(size_t len) {
  ensureSodium();
  Bytes out(len);
  randombytes_buf(out.data(), out.size());
  return out;
}

} // namespace hierfed
