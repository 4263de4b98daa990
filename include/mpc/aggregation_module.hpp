#pragma once
#include "mpc/shamir.hpp"
#include "utils/error_codes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hierfed {

// Metadata about the aggregation protocol
struct ProtocolMetadata {
  std::string protocol_name;
  int min_participants;
  int threshold;   // partial sums needed to reconstruct
  int share_count; // one per fog node
  nlohmann::json parameters; // Protocol-specific parameters
};

// Abstract base class for secure aggregation modules.
// Handles the protocol lifecycle across the three tiers:
// sharding (facility) -> partial sums (fog) -> reconstruction (leader)
class AggregationModule {
public:
  virtual ~AggregationModule() = default;

  // ===== Facility Phase =====

  // Split a privatized update into one share per fog node
  virtual Result<std::vector<Share>>
  shardUpdate(const std::vector<double> &update) const = 0;

  // ===== Fog Phase =====

  // Sum the shares one fog node collected from all participating facilities
  virtual Result<Share>
  computePartial(const std::vector<Share> &collected) const = 0;

  // ===== Leader Phase =====

  // Reconstruct the participants' sum from partial sums and average it
  virtual Result<std::vector<double>>
  aggregate(const std::vector<Share> &partials,
            size_t participant_count) const = 0;

  virtual ProtocolMetadata getProtocolMetadata() const = 0;
};

} // namespace hierfed
