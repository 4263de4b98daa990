#include "leader/leader_server.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  std::string config_path = "hierfed.json";
  if (argc >= 2) config_path = argv[1];

  std::cout << "Starting HierFed Leader..." << std::endl;

  try {
    hierfed::DeploymentConfig config(config_path);
    std::cout << "Facilities: " << config.registry.facilities.size()
              << ", fog nodes: " << config.fogCount()
              << " (t=" << config.reconstruction_threshold
              << "), validators: " << config.validatorCount()
              << " (quorum " << config.voteQuorum() << ")" << std::endl;

    hierfed::LeaderServer server(config);
    server.start();
  } catch (const std::exception &e) {
    LOG_AND_EXIT("Leader failed: " << e.what(), 1);
  }
  return 0;
}
