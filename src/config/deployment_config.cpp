#include "config/deployment_config.hpp"
#include "mpc/field.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace hierfed {

Registry Registry::withDefaults(int facilities, int fog_nodes, int validators,
                                const std::string &host) {
  Registry registry;
  registry.authority = Endpoint{"authority", host, 7600, {}};
  registry.leader = Endpoint{"leader", host, 7650, {}};
  for (int k = 0; k < facilities; ++k) {
    registry.facilities.push_back(Endpoint{"facility-" + std::to_string(k),
                                           host, 9600 + k,
                                           {"facility", "region:north"}});
  }
  for (int i = 0; i < fog_nodes; ++i) {
    registry.fog_nodes.push_back(
        Endpoint{"fog-" + std::to_string(i), host, 8600 + i, {}});
  }
  for (int v = 0; v < validators; ++v) {
    registry.validators.push_back(
        Endpoint{"validator-" + std::to_string(v), host, 8700 + v, {}});
  }
  return registry;
}

std::optional<Endpoint> Registry::findFacility(const std::string &id) const {
  for (const auto &facility : facilities) {
    if (facility.id == id) {
      return facility;
    }
  }
  return std::nullopt;
}

DeploymentConfig::DeploymentConfig(DefaultsTag) { setDefaults(); }

DeploymentConfig::DeploymentConfig(const std::string &configFile) {
  setDefaults();

  // Try to load from config file
  std::ifstream file(configFile);
  if (file.is_open()) {
    try {
      nlohmann::json config;
      file >> config;
      apply(config);
      validate();
    } catch (const std::exception &e) {
      throw std::runtime_error("Failed to load config from " + configFile +
                               ": " + e.what());
    }
  } else {
    validate();
  }
}

DeploymentConfig DeploymentConfig::fromJson(const nlohmann::json &config) {
  DeploymentConfig result{DefaultsTag{}};
  result.apply(config);
  result.validate();
  return result;
}

void DeploymentConfig::setDefaults() {
  registry = Registry::withDefaults(4, 3, 4);
  reconstruction_threshold = 2;
  min_participants = 2;
  max_byzantine = 1;
  collection_timeout_ms = 10000;
  reconstruction_timeout_ms = 10000;
  voting_timeout_ms = 5000;
  broadcast_timeout_ms = 5000;
  retry_initial_backoff_ms = 100;
  retry_max_backoff_ms = 2000;
  connection_timeout_ms = 2000;
  read_timeout_ms = 5000;
  dp_enabled = true;
  dp_epsilon = 1.0;
  dp_delta = 1e-5;
  dp_clip_norm = 1.0;
  pow_difficulty_bits = 16;
  challenge_ttl_ms = 60000;
  attribute_universe = {"facility",     "hospital",     "clinic",
                        "research_center", "region:north", "region:south",
                        "region:east",  "region:west"};
  access_policy = "facility";
  model_dimension = 4;
  initial_parameters.assign(model_dimension, 0.0);
  max_abs_parameter = 1e6;
  max_update_norm = 1e3;
  use_tls = false;
  cert_file = "";
  private_key_file = "";
}

void DeploymentConfig::apply(const nlohmann::json &config) {
  if (config.contains("registry")) {
    const auto &r = config["registry"];
    // Counts expand to the port-base layout; explicit lists override them
    if (r.contains("facility_count") || r.contains("fog_count") ||
        r.contains("validator_count")) {
      registry = Registry::withDefaults(
          r.value("facility_count", 4), r.value("fog_count", 3),
          r.value("validator_count", 4), r.value("host", std::string("127.0.0.1")));
    }
    if (r.contains("authority")) registry.authority = r["authority"].get<Endpoint>();
    if (r.contains("leader")) registry.leader = r["leader"].get<Endpoint>();
    if (r.contains("facilities")) registry.facilities = r["facilities"].get<std::vector<Endpoint>>();
    if (r.contains("fog_nodes")) registry.fog_nodes = r["fog_nodes"].get<std::vector<Endpoint>>();
    if (r.contains("validators")) registry.validators = r["validators"].get<std::vector<Endpoint>>();
  }

  if (config.contains("reconstruction_threshold")) reconstruction_threshold = config["reconstruction_threshold"];
  if (config.contains("min_participants")) min_participants = config["min_participants"];
  if (config.contains("max_byzantine")) max_byzantine = config["max_byzantine"];
  if (config.contains("collection_timeout_ms")) collection_timeout_ms = config["collection_timeout_ms"];
  if (config.contains("reconstruction_timeout_ms")) reconstruction_timeout_ms = config["reconstruction_timeout_ms"];
  if (config.contains("voting_timeout_ms")) voting_timeout_ms = config["voting_timeout_ms"];
  if (config.contains("broadcast_timeout_ms")) broadcast_timeout_ms = config["broadcast_timeout_ms"];
  if (config.contains("retry_initial_backoff_ms")) retry_initial_backoff_ms = config["retry_initial_backoff_ms"];
  if (config.contains("retry_max_backoff_ms")) retry_max_backoff_ms = config["retry_max_backoff_ms"];
  if (config.contains("connection_timeout_ms")) connection_timeout_ms = config["connection_timeout_ms"];
  if (config.contains("read_timeout_ms")) read_timeout_ms = config["read_timeout_ms"];
  if (config.contains("dp_enabled")) dp_enabled = config["dp_enabled"];
  if (config.contains("dp_epsilon")) dp_epsilon = config["dp_epsilon"];
  if (config.contains("dp_delta")) dp_delta = config["dp_delta"];
  if (config.contains("dp_clip_norm")) dp_clip_norm = config["dp_clip_norm"];
  if (config.contains("pow_difficulty_bits")) pow_difficulty_bits = config["pow_difficulty_bits"];
  if (config.contains("challenge_ttl_ms")) challenge_ttl_ms = config["challenge_ttl_ms"];
  if (config.contains("attribute_universe")) attribute_universe = config["attribute_universe"].get<std::vector<std::string>>();
  if (config.contains("access_policy")) access_policy = config["access_policy"];
  if (config.contains("model_dimension")) {
    model_dimension = config["model_dimension"];
    initial_parameters.assign(model_dimension, 0.0);
  }
  if (config.contains("initial_parameters")) {
    initial_parameters = config["initial_parameters"].get<std::vector<double>>();
    if (!config.contains("model_dimension")) {
      model_dimension = static_cast<int>(initial_parameters.size());
    }
  }
  if (config.contains("max_abs_parameter")) max_abs_parameter = config["max_abs_parameter"];
  if (config.contains("max_update_norm")) max_update_norm = config["max_update_norm"];
  if (config.contains("use_tls")) use_tls = config["use_tls"];
  if (config.contains("cert_file")) cert_file = config["cert_file"];
  if (config.contains("private_key_file")) private_key_file = config["private_key_file"];
}

void DeploymentConfig::validate() const {
  auto checkPort = [](const Endpoint &e) {
    if (e.port < 1 || e.port > 65535) {
      throw std::invalid_argument("Invalid port for " + e.id + ": " + std::to_string(e.port) + ". Must be 1-65535");
    }
    if (e.host.empty()) {
      throw std::invalid_argument("Host cannot be empty for " + e.id);
    }
  };
  checkPort(registry.authority);
  checkPort(registry.leader);
  for (const auto &e : registry.facilities) checkPort(e);
  for (const auto &e : registry.fog_nodes) checkPort(e);
  for (const auto &e : registry.validators) checkPort(e);

  if (registry.facilities.empty()) {
    throw std::invalid_argument("Registry must list at least one facility");
  }

  if (registry.facilities.size() > PrimeField::MAX_SUMMANDS) {
    throw std::invalid_argument("Registry lists " + std::to_string(registry.facilities.size()) + " facilities; field sums stay exact for at most " + std::to_string(PrimeField::MAX_SUMMANDS));
  }

  if (reconstruction_threshold < 1 || reconstruction_threshold > fogCount()) {
    throw std::invalid_argument("Invalid reconstruction_threshold: " + std::to_string(reconstruction_threshold) + ". Must be 1-" + std::to_string(fogCount()) + " (number of fog nodes)");
  }

  if (min_participants < 1) {
    throw std::invalid_argument("Invalid min_participants: " + std::to_string(min_participants) + ". Must be >= 1");
  }

  if (min_participants > static_cast<int>(registry.facilities.size())) {
    throw std::invalid_argument("Invalid min_participants: " + std::to_string(min_participants) + ". Exceeds facility count (" + std::to_string(registry.facilities.size()) + ")");
  }

  if (max_byzantine < 0) {
    throw std::invalid_argument("Invalid max_byzantine: " + std::to_string(max_byzantine) + ". Must be >= 0");
  }

  if (validatorCount() < 3 * max_byzantine + 1) {
    throw std::invalid_argument("Validator committee of " + std::to_string(validatorCount()) + " cannot tolerate " + std::to_string(max_byzantine) + " Byzantine members (needs >= 3f+1)");
  }

  if (collection_timeout_ms < 1 || reconstruction_timeout_ms < 1 || voting_timeout_ms < 1 || broadcast_timeout_ms < 1) {
    throw std::invalid_argument("Phase timeouts must be >= 1 ms");
  }

  if (retry_initial_backoff_ms < 1 || retry_max_backoff_ms < retry_initial_backoff_ms) {
    throw std::invalid_argument("Invalid retry backoff: initial must be >= 1 and <= max");
  }

  if (connection_timeout_ms < 1 || read_timeout_ms < 1) {
    throw std::invalid_argument("HTTP client timeouts must be >= 1 ms");
  }

  if (dp_enabled) {
    if (!(dp_epsilon > 0.0)) {
      throw std::invalid_argument("Invalid dp_epsilon: must be > 0");
    }
    if (!(dp_delta > 0.0 && dp_delta < 1.0)) {
      throw std::invalid_argument("Invalid dp_delta: must be in (0, 1)");
    }
    if (!(dp_clip_norm > 0.0)) {
      throw std::invalid_argument("Invalid dp_clip_norm: must be > 0");
    }
  }

  if (pow_difficulty_bits < 0 || pow_difficulty_bits > 64) {
    throw std::invalid_argument("Invalid pow_difficulty_bits: " + std::to_string(pow_difficulty_bits) + ". Must be 0-64");
  }

  if (challenge_ttl_ms < 1) {
    throw std::invalid_argument("Invalid challenge_ttl_ms: must be >= 1");
  }

  if (model_dimension < 1) {
    throw std::invalid_argument("Invalid model_dimension: must be >= 1");
  }

  if (static_cast<int>(initial_parameters.size()) != model_dimension) {
    throw std::invalid_argument("initial_parameters has " + std::to_string(initial_parameters.size()) + " entries, expected model_dimension (" + std::to_string(model_dimension) + ")");
  }

  if (access_policy.empty()) {
    throw std::invalid_argument("access_policy cannot be empty");
  }

  if (!(max_abs_parameter > 0.0) || !(max_update_norm > 0.0)) {
    throw std::invalid_argument("Validator bounds must be > 0");
  }

  for (const auto &facility : registry.facilities) {
    for (const auto &attribute : facility.attributes) {
      bool known = false;
      for (const auto &allowed : attribute_universe) {
        if (allowed == attribute) known = true;
      }
      if (!known) {
        throw std::invalid_argument("Facility " + facility.id + " declares attribute outside attribute_universe: " + attribute);
      }
    }
  }

  if (use_tls) {
    if (cert_file.empty() || private_key_file.empty()) {
      throw std::invalid_argument("TLS enabled but cert_file or private_key_file not provided");
    }
  }
}

} // namespace hierfed
