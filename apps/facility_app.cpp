#include "facility/facility_server.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char *argv[]) {
  std::string config_path = "hierfed.json";
  int index = 0;
  if (argc >= 2) config_path = argv[1];
  if (argc >= 3) index = std::stoi(argv[2]);

  std::cout << "Starting HierFed Facility " << index << "..." << std::endl;

  try {
    hierfed::DeploymentConfig config(config_path);
    if (index < 0 ||
        index >= static_cast<int>(config.registry.facilities.size())) {
      LOG_AND_EXIT("Index " << index << " outside the facility registry", 2);
    }

    hierfed::FacilityServer server(
        config, index, std::make_unique<hierfed::DeltaTrainingModule>());
    std::cout << "Waiting for POST /register to bootstrap identity" << std::endl;
    server.start();
  } catch (const std::exception &e) {
    LOG_AND_EXIT("Facility failed: " << e.what(), 1);
  }
  return 0;
}
