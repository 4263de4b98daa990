#include "authority/authority_server.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  std::string config_path = "hierfed.json";
  if (argc >= 2) config_path = argv[1];

  std::cout << "Starting HierFed Trusted Authority..." << std::endl;

  try {
    hierfed::DeploymentConfig config(config_path);
    hierfed::AuthorityServer server(config);
    std::cout << "PoW difficulty: " << config.pow_difficulty_bits
              << " bits, attributes: " << config.attribute_universe.size()
              << std::endl;
    server.start();
  } catch (const std::exception &e) {
    LOG_AND_EXIT("Trusted authority failed: " << e.what(), 1);
  }
  return 0;
}
