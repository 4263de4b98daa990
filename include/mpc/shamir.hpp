#pragma once
#include "mpc/field.hpp"
#include "utils/error_codes.hpp"
#include <cstdint>
#include <vector>

namespace hierfed {

// One evaluation of a vector of sharing polynomials at point x
struct Share {
  uint64_t x = 0;
  std::vector<FieldElement> values;
};

// Shamir (t, n) sharing of field vectors. Share j is the evaluation at
// x = j + 1, so share index and fog index coincide.
class ShamirSharing {
public:
  ShamirSharing(int threshold, int share_count);

  Result<std::vector<Share>> split(const std::vector<FieldElement> &secret) const;

  // Interpolates at zero from the first `threshold` shares
  Result<std::vector<FieldElement>>
  reconstruct(const std::vector<Share> &shares) const;

  // Lagrange basis coefficient for xs[i] evaluated at zero
  static FieldElement lagrangeAtZero(const std::vector<uint64_t> &xs, size_t i);

  int threshold() const { return threshold_; }
  int shareCount() const { return share_count_; }

private:
  int threshold_;
  int share_count_;
};

} // namespace hierfed
