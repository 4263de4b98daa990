#pragma once
#include "facility/facility.hpp"
#include "utils/background_tasks.hpp"
#include "utils/connection_pool.hpp"
#include "utils/http_service.hpp"
#include <mutex>
#include <vector>

namespace hierfed {

class FacilityServer : public HttpService {
public:
  FacilityServer(const DeploymentConfig &config, int index,
                 std::unique_ptr<TrainingModule> training);
  ~FacilityServer() override;

  void stop() override;

  // Challenge, proof of work and registration against the TA
  Result<Identity> bootstrap();

  // Fetches rotated attribute keys from the TA
  Result<void> refreshKeys();

  Facility &facility() { return facility_; }

protected:
  void setupRoutes(httplib::Server &server) override;

private:
  void handleEndpointRegister(const httplib::Request &, httplib::Response &);
  void handleEndpointStartRound(const httplib::Request &, httplib::Response &);
  void handleEndpointRound(const httplib::Request &, httplib::Response &);
  void handleEndpointGlobalModel(const httplib::Request &, httplib::Response &);

  Result<std::string> fetchAuthorityKey();

  // Prepares shares now and delivers them to the fog tier off the request
  // thread, every fog node in parallel
  void contributeIfReady();
  void deliverShares(std::vector<ShareMessage> shares, int64_t deadline_ms);

  Facility facility_;
  ConnectionPool connection_pool_;

  std::mutex ta_key_mutex_;
  std::string ta_public_key_;

  // One share delivery per contributed round
  BackgroundTasks workers_;
};

} // namespace hierfed
