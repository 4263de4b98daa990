#include "mpc/shamir_aggregation.hpp"
#include "utils/logging.hpp"
#include <string>

namespace hierfed {

ShamirAggregationModule::ShamirAggregationModule(int threshold, int fog_count,
                                                 int min_participants)
    : sharing_(threshold, fog_count), min_participants_(min_participants) {}

Result<std::vector<Share>>
ShamirAggregationModule::shardUpdate(const std::vector<double> &update) const {
  auto encoded = PrimeField::encodeVector(update);
  if (!encoded) {
    return Result<std::vector<Share>>(encoded.error(), encoded.message());
  }
  DEBUG_DEBUG("Sharding update of " << update.size() << " parameters into "
                                    << sharing_.shareCount() << " shares");
  return sharing_.split(encoded.value());
}

Result<Share>
ShamirAggregationModule::computePartial(const std::vector<Share> &collected) const {
  if (collected.empty()) {
    return Result<Share>(ErrorCode::AggregationInsufficientShares,
                         "no shares collected");
  }

  Share partial;
  partial.x = collected.front().x;
  partial.values.assign(collected.front().values.size(), 0);

  for (const auto &share : collected) {
    if (share.x != partial.x) {
      return Result<Share>(ErrorCode::AggregationInvalidData,
                           "share for x=" + std::to_string(share.x) +
                               " mixed into partial sum for x=" +
                               std::to_string(partial.x));
    }
    if (share.values.size() != partial.values.size()) {
      return Result<Share>(ErrorCode::AggregationDimensionMismatch,
                           "share has " + std::to_string(share.values.size()) +
                               " values, expected " +
                               std::to_string(partial.values.size()));
    }
    for (size_t c = 0; c < share.values.size(); ++c) {
      partial.values[c] = PrimeField::add(partial.values[c],
                                          share.values[c] % PrimeField::MODULUS);
    }
  }
  DEBUG_DEBUG("Partial sum at x=" << partial.x << " over " << collected.size()
                                  << " shares");
  return partial;
}

Result<std::vector<double>>
ShamirAggregationModule::aggregate(const std::vector<Share> &partials,
                                   size_t participant_count) const {
  using R = Result<std::vector<double>>;
  if (participant_count == 0) {
    return R(ErrorCode::AggregationInvalidData, "no participants");
  }
  auto sum = sharing_.reconstruct(partials);
  if (!sum) {
    return R(sum.error(), sum.message());
  }

  std::vector<double> average = PrimeField::decodeVector(sum.value());
  for (double &value : average) {
    value /= static_cast<double>(participant_count);
  }
  return average;
}

ProtocolMetadata ShamirAggregationModule::getProtocolMetadata() const {
  return ProtocolMetadata{
      .protocol_name = "shamir-threshold-average",
      .min_participants = min_participants_,
      .threshold = sharing_.threshold(),
      .share_count = sharing_.shareCount(),
      .parameters = {{"modulus", "2^61-1"},
                     {"fractional_bits", PrimeField::FRACTIONAL_BITS}}};
}

} // namespace hierfed
