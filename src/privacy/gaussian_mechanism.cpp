#include "privacy/gaussian_mechanism.hpp"
#include "crypto/digest.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace hierfed {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

// Uniform double in (0, 1]
double uniformOpenZero() {
  uint64_t bits = randomWord() >> 11;
  return (static_cast<double>(bits) + 1.0) / 9007199254740992.0; // 2^53
}

} // namespace

GaussianMechanism::GaussianMechanism(double epsilon, double delta,
                                     double clip_norm)
    : epsilon_(epsilon), delta_(delta), clip_norm_(clip_norm),
      sigma_(calibrateSigma(epsilon, delta, clip_norm)) {}

double GaussianMechanism::calibrateSigma(double epsilon, double delta,
                                         double clip_norm) {
  if (!(epsilon > 0.0) || !(delta > 0.0 && delta < 1.0) || !(clip_norm > 0.0)) {
    throw std::invalid_argument("Gaussian mechanism needs epsilon > 0, "
                                "0 < delta < 1 and clip_norm > 0");
  }
  return std::sqrt(2.0 * std::log(1.25 / delta)) * clip_norm / epsilon;
}

double GaussianMechanism::l2Norm(const std::vector<double> &values) {
  double sum = 0.0;
  for (double v : values) {
    sum += v * v;
  }
  return std::sqrt(sum);
}

std::vector<double> GaussianMechanism::clip(const std::vector<double> &values,
                                            double bound) {
  double norm = l2Norm(values);
  if (norm <= bound || norm == 0.0) {
    return values;
  }
  double factor = bound / norm;
  std::vector<double> out;
  out.reserve(values.size());
  for (double v : values) {
    out.push_back(v * factor);
  }
  return out;
}

double GaussianMechanism::sampleStandardNormal() {
  double u1 = uniformOpenZero();
  double u2 = uniformOpenZero();
  return std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
}

std::vector<double>
GaussianMechanism::privatize(const std::vector<double> &delta) const {
  std::vector<double> out = clip(delta, clip_norm_);
  for (double &v : out) {
    v += sigma_ * sampleStandardNormal();
  }
  return out;
}

Result<void> PrivacyLedger::spend(uint64_t round, double epsilon, double delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (spends_.count(round) != 0) {
    DEBUG_WARN("Refusing second privacy spend for round " << round);
    return Result<void>(ErrorCode::AggregationPrivacyBudgetSpent,
                        "round " + std::to_string(round) +
                            " already released a noised update");
  }
  spends_.emplace(round, std::make_pair(epsilon, delta));
  return Result<void>();
}

bool PrivacyLedger::hasSpent(uint64_t round) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spends_.count(round) != 0;
}

size_t PrivacyLedger::roundsSpent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spends_.size();
}

double PrivacyLedger::totalEpsilon() const {
  std::lock_guard<std::mutex> lock(mutex_);
  double total = 0.0;
  for (const auto &[round, spend] : spends_) {
    total += spend.first;
  }
  return total;
}

double PrivacyLedger::totalDelta() const {
  std::lock_guard<std::mutex> lock(mutex_);
  double total = 0.0;
  for (const auto &[round, spend] : spends_) {
    total += spend.second;
  }
  return total;
}

} // namespace hierfed
