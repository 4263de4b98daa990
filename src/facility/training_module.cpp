#include "facility/training_module.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"

namespace hierfed {

Result<std::vector<double>>
DeltaTrainingModule::train(const std::vector<double> &global_parameters,
                           const std::string &local_data) {
  using R = Result<std::vector<double>>;
  if (local_data.empty()) {
    return global_parameters;
  }

  auto delta = parseFloat64Payload(local_data);
  if (!delta) {
    return R(ErrorCode::AggregationInvalidData,
             "payload of " + std::to_string(local_data.size()) +
                 " bytes is not a float64 array");
  }
  if (delta->size() != global_parameters.size()) {
    return R(ErrorCode::AggregationDimensionMismatch,
             "delta has " + std::to_string(delta->size()) +
                 " entries, model has " +
                 std::to_string(global_parameters.size()));
  }

  std::vector<double> local = global_parameters;
  for (size_t i = 0; i < local.size(); ++i) {
    local[i] += (*delta)[i];
  }
  DEBUG_DEBUG("Applied local delta over " << local.size() << " parameters");
  return local;
}

} // namespace hierfed
