#pragma once
#include "utils/error_codes.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace hierfed {

// (epsilon, delta) Gaussian mechanism over L2-clipped update deltas
class GaussianMechanism {
public:
  GaussianMechanism(double epsilon, double delta, double clip_norm);

  // sigma = sqrt(2 ln(1.25 / delta)) * clip_norm / epsilon
  static double calibrateSigma(double epsilon, double delta, double clip_norm);

  static double l2Norm(const std::vector<double> &values);

  // Scales `values` down so that its L2 norm is at most `bound`
  static std::vector<double> clip(const std::vector<double> &values,
                                  double bound);

  // Clips `delta` and adds independent N(0, sigma^2) noise per coordinate
  std::vector<double> privatize(const std::vector<double> &delta) const;

  double sigma() const { return sigma_; }
  double epsilon() const { return epsilon_; }
  double delta() const { return delta_; }
  double clipNorm() const { return clip_norm_; }

  // Standard normal sample via Box-Muller on CSPRNG output
  static double sampleStandardNormal();

private:
  double epsilon_;
  double delta_;
  double clip_norm_;
  double sigma_;
};

// Records one privacy spend per round; a second spend for the same round is
// refused so a noised update is never recomputed with fresh noise.
class PrivacyLedger {
public:
  Result<void> spend(uint64_t round, double epsilon, double delta);

  bool hasSpent(uint64_t round) const;
  size_t roundsSpent() const;

  // Basic sequential composition over all recorded rounds
  double totalEpsilon() const;
  double totalDelta() const;

private:
  mutable std::mutex mutex_;
  std::map<uint64_t, std::pair<double, double>> spends_;
};

} // namespace hierfed
