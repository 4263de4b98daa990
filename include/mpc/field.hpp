#pragma once
#include "utils/error_codes.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace hierfed {

using FieldElement = uint64_t;

// Arithmetic over GF(2^61 - 1) plus the signed fixed-point encoding used to
// carry real-valued parameters through secret sharing.
class PrimeField {
public:
  static constexpr uint64_t MODULUS = (1ull << 61) - 1;
  static constexpr int FRACTIONAL_BITS = 20;
  static constexpr double SCALE = static_cast<double>(1ull << FRACTIONAL_BITS);

  // Largest encodable magnitude after scaling. Leaves headroom so that sums of
  // up to MAX_SUMMANDS encoded values do not wrap past MODULUS / 2.
  static constexpr uint64_t MAX_SCALED = 1ull << 50;
  static constexpr size_t MAX_SUMMANDS = 1u << 10;

  static FieldElement reduce(unsigned __int128 value) {
    uint64_t lo = static_cast<uint64_t>(value & MODULUS);
    uint64_t hi = static_cast<uint64_t>(value >> 61);
    uint64_t r = lo + hi;
    r = (r & MODULUS) + (r >> 61);
    return r >= MODULUS ? r - MODULUS : r;
  }

  static FieldElement add(FieldElement a, FieldElement b) {
    uint64_t r = a + b;
    return r >= MODULUS ? r - MODULUS : r;
  }

  static FieldElement sub(FieldElement a, FieldElement b) {
    return a >= b ? a - b : MODULUS - (b - a);
  }

  static FieldElement neg(FieldElement a) { return a == 0 ? 0 : MODULUS - a; }

  static FieldElement mul(FieldElement a, FieldElement b) {
    return reduce(static_cast<unsigned __int128>(a) * b);
  }

  static FieldElement pow(FieldElement base, uint64_t exponent);

  // Multiplicative inverse via Fermat; a must be non-zero
  static FieldElement inverse(FieldElement a);

  // Uniform element from the libsodium CSPRNG
  static FieldElement random();

  static Result<FieldElement> encode(double value);
  static double decode(FieldElement element);

  static Result<std::vector<FieldElement>>
  encodeVector(const std::vector<double> &values);
  static std::vector<double>
  decodeVector(const std::vector<FieldElement> &elements);
};

} // namespace hierfed
