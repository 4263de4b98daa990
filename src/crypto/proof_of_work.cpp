#include "crypto/proof_of_work.hpp"
#include "crypto/digest.hpp"
#include "utils/logging.hpp"

namespace hierfed {

std::string PowPuzzle::input(const std::string &facility_id,
                             const std::string &challenge, uint64_t nonce) {
  return facility_id + "||" + challenge + "||" + std::to_string(nonce);
}

bool PowPuzzle::verify(const std::string &facility_id,
                       const std::string &challenge, uint64_t nonce,
                       int difficulty_bits) {
  auto digest = sha256(input(facility_id, challenge, nonce));
  return leadingZeroBits(digest) >= difficulty_bits;
}

std::optional<uint64_t> PowPuzzle::solve(const std::string &facility_id,
                                         const std::string &challenge,
                                         int difficulty_bits,
                                         uint64_t max_iterations) {
  for (uint64_t nonce = 0; nonce < max_iterations; ++nonce) {
    if (verify(facility_id, challenge, nonce, difficulty_bits)) {
      DEBUG_DEBUG("Solved PoW for " << facility_id << " after " << nonce + 1
                                    << " attempts");
      return nonce;
    }
  }
  DEBUG_WARN("PoW search exhausted " << max_iterations << " nonces for "
                                     << facility_id);
  return std::nullopt;
}

} // namespace hierfed
