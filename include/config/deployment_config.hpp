#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hierfed {

// Network address of one service instance
struct Endpoint {
  std::string id;
  std::string host;
  int port = 0;
  // Declared role attributes (facilities only), e.g. "facility", "region:north"
  std::vector<std::string> attributes;
};

inline void to_json(nlohmann::json &j, const Endpoint &e) {
  j = nlohmann::json{{"id", e.id}, {"host", e.host}, {"port", e.port}};
  if (!e.attributes.empty()) {
    j["attributes"] = e.attributes;
  }
}

inline void from_json(const nlohmann::json &j, Endpoint &e) {
  j.at("id").get_to(e.id);
  e.host = j.value("host", std::string("127.0.0.1"));
  j.at("port").get_to(e.port);
  e.attributes = j.value("attributes", std::vector<std::string>{});
}

// Explicit addressing table handed to every service at construction
struct Registry {
  Endpoint authority;
  Endpoint leader;
  std::vector<Endpoint> facilities;
  std::vector<Endpoint> fog_nodes;
  std::vector<Endpoint> validators;

  // Port-base layout: TA 7600, leader 7650, fog 8600+i, validator 8700+v,
  // facility 9600+k
  static Registry withDefaults(int facilities, int fog_nodes, int validators,
                               const std::string &host = "127.0.0.1");

  std::optional<Endpoint> findFacility(const std::string &id) const;
};

struct DeploymentConfig {
  Registry registry;

  // Secret sharing: n is the number of fog nodes
  int reconstruction_threshold;
  int min_participants;

  // Byzantine tolerance of the validator committee
  int max_byzantine;

  // Phase deadlines
  int collection_timeout_ms;
  int reconstruction_timeout_ms;
  int voting_timeout_ms;
  // Deadline for pushing a finalized model to the facilities
  int broadcast_timeout_ms;

  // Inter-tier retry/backoff and HTTP client timeouts
  int retry_initial_backoff_ms;
  int retry_max_backoff_ms;
  int connection_timeout_ms;
  int read_timeout_ms;

  // Differential privacy
  bool dp_enabled;
  double dp_epsilon;
  double dp_delta;
  double dp_clip_norm;

  // Registration
  int pow_difficulty_bits;
  // An unanswered challenge expires after this long
  int challenge_ttl_ms;
  std::vector<std::string> attribute_universe;

  // Model and access control
  std::string access_policy;
  int model_dimension;
  std::vector<double> initial_parameters;

  // Validator checks
  double max_abs_parameter;
  double max_update_norm;

  // TLS settings
  bool use_tls;
  std::string cert_file;
  std::string private_key_file;

  // Defaults, overridden by configFile when it exists
  DeploymentConfig(const std::string &configFile = "hierfed.json");

  static DeploymentConfig fromJson(const nlohmann::json &config);

  int fogCount() const { return static_cast<int>(registry.fog_nodes.size()); }
  int validatorCount() const {
    return static_cast<int>(registry.validators.size());
  }

  // Minimum accepting votes: ceil((2V + 1) / 3)
  int voteQuorum() const { return (2 * validatorCount() + 3) / 3; }

  void validate() const;

private:
  struct DefaultsTag {};
  explicit DeploymentConfig(DefaultsTag);
  void setDefaults();
  void apply(const nlohmann::json &config);
};

} // namespace hierfed
