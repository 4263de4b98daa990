#include "mpc/shamir.hpp"
#include "utils/logging.hpp"
#include <set>
#include <stdexcept>
#include <string>

namespace hierfed {

ShamirSharing::ShamirSharing(int threshold, int share_count)
    : threshold_(threshold), share_count_(share_count) {
  if (threshold < 1 || threshold > share_count) {
    throw std::invalid_argument("Shamir threshold " + std::to_string(threshold) +
                                " must be within 1.." +
                                std::to_string(share_count));
  }
}

Result<std::vector<Share>>
ShamirSharing::split(const std::vector<FieldElement> &secret) const {
  if (secret.empty()) {
    return Result<std::vector<Share>>(ErrorCode::AggregationInvalidData,
                                      "cannot share an empty vector");
  }

  std::vector<Share> shares(share_count_);
  for (int j = 0; j < share_count_; ++j) {
    shares[j].x = static_cast<uint64_t>(j + 1);
    shares[j].values.resize(secret.size());
  }

  std::vector<FieldElement> coefficients(threshold_);
  for (size_t c = 0; c < secret.size(); ++c) {
    coefficients[0] = secret[c] % PrimeField::MODULUS;
    for (int k = 1; k < threshold_; ++k) {
      coefficients[k] = PrimeField::random();
    }
    for (auto &share : shares) {
      // Horner evaluation of the degree t-1 polynomial
      FieldElement acc = 0;
      for (int k = threshold_ - 1; k >= 0; --k) {
        acc = PrimeField::add(PrimeField::mul(acc, share.x), coefficients[k]);
      }
      share.values[c] = acc;
    }
  }
  return shares;
}

FieldElement ShamirSharing::lagrangeAtZero(const std::vector<uint64_t> &xs,
                                           size_t i) {
  FieldElement numerator = 1;
  FieldElement denominator = 1;
  for (size_t m = 0; m < xs.size(); ++m) {
    if (m == i) {
      continue;
    }
    // l_i(0) = prod x_m / (x_m - x_i)
    numerator = PrimeField::mul(numerator, xs[m]);
    denominator = PrimeField::mul(denominator, PrimeField::sub(xs[m], xs[i]));
  }
  return PrimeField::mul(numerator, PrimeField::inverse(denominator));
}

Result<std::vector<FieldElement>>
ShamirSharing::reconstruct(const std::vector<Share> &shares) const {
  using R = Result<std::vector<FieldElement>>;
  if (static_cast<int>(shares.size()) < threshold_) {
    return R(ErrorCode::AggregationInsufficientShares,
             "need " + std::to_string(threshold_) + " shares, have " +
                 std::to_string(shares.size()));
  }

  std::vector<Share> used(shares.begin(), shares.begin() + threshold_);
  std::vector<uint64_t> xs;
  std::set<uint64_t> seen;
  const size_t dimension = used.front().values.size();
  for (const auto &share : used) {
    if (share.x == 0 || share.x >= PrimeField::MODULUS ||
        !seen.insert(share.x).second) {
      return R(ErrorCode::AggregationInvalidData,
               "invalid or repeated evaluation point " + std::to_string(share.x));
    }
    if (share.values.size() != dimension) {
      return R(ErrorCode::AggregationDimensionMismatch,
               "share at x=" + std::to_string(share.x) + " has " +
                   std::to_string(share.values.size()) + " values, expected " +
                   std::to_string(dimension));
    }
    xs.push_back(share.x);
  }

  std::vector<FieldElement> basis(xs.size());
  for (size_t i = 0; i < xs.size(); ++i) {
    basis[i] = lagrangeAtZero(xs, i);
  }

  std::vector<FieldElement> secret(dimension, 0);
  for (size_t c = 0; c < dimension; ++c) {
    for (size_t i = 0; i < used.size(); ++i) {
      secret[c] = PrimeField::add(
          secret[c], PrimeField::mul(basis[i], used[i].values[c] % PrimeField::MODULUS));
    }
  }
  DEBUG_DEBUG("Reconstructed " << dimension << " coordinates from "
                               << used.size() << " shares");
  return secret;
}

} // namespace hierfed
