#pragma once
#include "mpc/aggregation_module.hpp"

namespace hierfed {

// Threshold secure averaging: Shamir shares summed per evaluation point are
// themselves shares of the sum, so any t partial sums reveal only the total.
class ShamirAggregationModule : public AggregationModule {
public:
  ShamirAggregationModule(int threshold, int fog_count, int min_participants);

  Result<std::vector<Share>>
  shardUpdate(const std::vector<double> &update) const override;

  Result<Share> computePartial(const std::vector<Share> &collected) const override;

  Result<std::vector<double>> aggregate(const std::vector<Share> &partials,
                                        size_t participant_count) const override;

  ProtocolMetadata getProtocolMetadata() const override;

private:
  ShamirSharing sharing_;
  int min_participants_;
};

} // namespace hierfed
