#include "mpc/field.hpp"
#include "crypto/digest.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace hierfed {

FieldElement PrimeField::pow(FieldElement base, uint64_t exponent) {
  FieldElement result = 1;
  base %= MODULUS;
  while (exponent > 0) {
    if (exponent & 1) {
      result = mul(result, base);
    }
    base = mul(base, base);
    exponent >>= 1;
  }
  return result;
}

FieldElement PrimeField::inverse(FieldElement a) {
  if (a % MODULUS == 0) {
    throw std::domain_error("zero has no inverse in GF(2^61 - 1)");
  }
  return pow(a, MODULUS - 2);
}

FieldElement PrimeField::random() {
  // Rejection sampling on 61-bit words keeps the distribution uniform
  while (true) {
    uint64_t candidate = randomWord() & MODULUS;
    if (candidate < MODULUS) {
      return candidate;
    }
  }
}

Result<FieldElement> PrimeField::encode(double value) {
  if (!std::isfinite(value)) {
    return Result<FieldElement>(ErrorCode::AggregationValueOutOfRange,
                                "non-finite value");
  }
  double scaled = std::round(value * SCALE);
  if (std::fabs(scaled) >= static_cast<double>(MAX_SCALED)) {
    return Result<FieldElement>(ErrorCode::AggregationValueOutOfRange,
                                "value " + std::to_string(value) +
                                    " exceeds fixed-point range");
  }
  auto magnitude = static_cast<uint64_t>(std::fabs(scaled));
  return scaled < 0 ? neg(magnitude) : magnitude;
}

double PrimeField::decode(FieldElement element) {
  element %= MODULUS;
  // Upper half of the field represents negative numbers
  if (element > MODULUS / 2) {
    return -static_cast<double>(MODULUS - element) / SCALE;
  }
  return static_cast<double>(element) / SCALE;
}

Result<std::vector<FieldElement>>
PrimeField::encodeVector(const std::vector<double> &values) {
  std::vector<FieldElement> out;
  out.reserve(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    auto encoded = encode(values[i]);
    if (!encoded) {
      return Result<std::vector<FieldElement>>(
          encoded.error(),
          "coordinate " + std::to_string(i) + ": " + std::string(encoded.message()));
    }
    out.push_back(encoded.value());
  }
  return out;
}

std::vector<double>
PrimeField::decodeVector(const std::vector<FieldElement> &elements) {
  std::vector<double> out;
  out.reserve(elements.size());
  for (FieldElement e : elements) {
    out.push_back(decode(e));
  }
  return out;
}

} // namespace hierfed
