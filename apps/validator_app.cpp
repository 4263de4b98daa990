#include "validator/validator_server.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  std::string config_path = "hierfed.json";
  int index = 0;
  if (argc >= 2) config_path = argv[1];
  if (argc >= 3) index = std::stoi(argv[2]);

  std::cout << "Starting HierFed Validator " << index << "..." << std::endl;

  try {
    hierfed::DeploymentConfig config(config_path);
    if (index < 0 || index >= static_cast<int>(config.registry.validators.size())) {
      LOG_AND_EXIT("Index " << index << " outside the validators registry", 2);
    }
    hierfed::ValidatorServer server(config, index);
    server.start();
  } catch (const std::exception &e) {
    LOG_AND_EXIT("Validator failed: " << e.what(), 1);
  }
  return 0;
}
