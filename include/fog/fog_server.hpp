#pragma once
#include "fog/fog_aggregator.hpp"
#include "utils/background_tasks.hpp"
#include "utils/connection_pool.hpp"
#include "utils/http_service.hpp"

namespace hierfed {

class FogServer : public HttpService {
public:
  FogServer(const DeploymentConfig &config, int index);
  ~FogServer() override;

  void stop() override;

  FogAggregator &aggregator() { return aggregator_; }

protected:
  void setupRoutes(httplib::Server &server) override;

private:
  void handleEndpointRound(const httplib::Request &, httplib::Response &);
  void handleEndpointShare(const httplib::Request &, httplib::Response &);

  bool ensureAuthorityKey();

  // Timer for one round: waits for all shares or the collection deadline,
  // then forwards the partial sum to the leader until the reconstruction
  // deadline
  void runRoundTimer(RoundAnnouncement announcement);

  FogAggregator aggregator_;
  ConnectionPool connection_pool_;

  // One timer per announced round
  BackgroundTasks timers_;
};

} // namespace hierfed
