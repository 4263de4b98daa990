#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hierfed {

// Idle -> Collecting -> FogReconstructing -> Validating -> Finalizing ->
// Broadcasting -> Idle. An aborted round returns straight to Idle.
enum class RoundState {
  Idle = 0,
  Collecting,
  FogReconstructing,
  Validating,
  Finalizing,
  Broadcasting
};

inline std::string_view roundStateToString(RoundState state) {
  switch (state) {
  case RoundState::Idle: return "Idle";
  case RoundState::Collecting: return "Collecting";
  case RoundState::FogReconstructing: return "FogReconstructing";
  case RoundState::Validating: return "Validating";
  case RoundState::Finalizing: return "Finalizing";
  case RoundState::Broadcasting: return "Broadcasting";
  }
  return "Unknown";
}

// Plaintext global model held by the leader
struct GlobalModel {
  uint64_t version = 1;
  std::vector<double> parameters;
  std::string access_policy;
};

} // namespace hierfed
