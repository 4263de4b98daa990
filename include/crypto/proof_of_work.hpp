#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace hierfed {

// Registration puzzle: SHA-256(facility_id || challenge || nonce) must fall
// below 2^(256 - difficulty_bits), i.e. start with difficulty_bits zero bits.
class PowPuzzle {
public:
  static std::string input(const std::string &facility_id,
                           const std::string &challenge, uint64_t nonce);

  static bool verify(const std::string &facility_id,
                     const std::string &challenge, uint64_t nonce,
                     int difficulty_bits);

  // Linear nonce search; nullopt if max_iterations is exhausted
  static std::optional<uint64_t> solve(const std::string &facility_id,
                                       const std::string &challenge,
                                       int difficulty_bits,
                                       uint64_t max_iterations = 1ull << 32);
};

} // namespace hierfed
