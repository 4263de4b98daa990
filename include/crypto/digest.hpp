#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hierfed {

using Bytes = std::vector<unsigned char>;
using Sha256Digest = std::array<unsigned char, 32>;

// Calls sodium_init() once; throws std::runtime_error if libsodium is unusable
void ensureSodium();

std::string toHex(const unsigned char *data, size_t len);
std::string toHex(const Bytes &data);
std::optional<Bytes> fromHex(std::string_view hex);

std::string toBase64(const Bytes &data);
std::optional<Bytes> fromBase64(std::string_view encoded);

Sha256Digest sha256(std::string_view data);
std::string sha256Hex(std::string_view data);

// Number of leading zero bits of a digest
int leadingZeroBits(const Sha256Digest &digest);

// Uniform random 64-bit word from the libsodium CSPRNG
uint64_t randomWord();
Bytes randomBytes(size_t len);

} // namespace hierfed
