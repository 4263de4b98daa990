#pragma once
#include "utils/error_codes.hpp"
#include <string>
#include <vector>

namespace hierfed {

// Abstract interface for local training
class TrainingModule {
public:
  virtual ~TrainingModule() = default;

  // Called when the facility contributes to a round. `local_data` is the raw
  // payload posted to /start_round. Returns the locally trained parameter
  // vector, which must have the same dimension as `global_parameters`.
  virtual Result<std::vector<double>>
  train(const std::vector<double> &global_parameters,
        const std::string &local_data) = 0;
};

// Treats the payload as a little-endian float64 parameter delta applied to
// the global model. An empty payload means no local change.
class DeltaTrainingModule : public TrainingModule {
public:
  Result<std::vector<double>> train(const std::vector<double> &global_parameters,
                                    const std::string &local_data) override;
};

} // namespace hierfed
