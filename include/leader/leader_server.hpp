#pragma once
#include "leader/round_coordinator.hpp"
#include "leader/round_transport.hpp"
#include "utils/connection_pool.hpp"
#include "utils/http_service.hpp"
#include <atomic>
#include <mutex>
#include <thread>

namespace hierfed {

// HTTP front of the round coordinator, and its transport to the other tiers
class LeaderServer : public HttpService, public RoundTransport {
public:
  explicit LeaderServer(const DeploymentConfig &config);
  ~LeaderServer() override;

  void stop() override;

  RoundCoordinator &coordinator() { return coordinator_; }

  // ===== RoundTransport =====
  PeerReadiness checkReadiness() override;
  Result<std::vector<std::string>> registeredFacilities() override;
  void announceRound(const RoundAnnouncement &announcement,
                     const PeerReadiness &peers) override;
  void requestVotes(const ValidationRequest &request, const PeerReadiness &peers,
                    std::chrono::steady_clock::time_point deadline,
                    const std::function<void(const Vote &)> &deliver) override;
  Result<AttributePublicParams> fetchPublicParams() override;
  void publishModel(const EncryptedModel &model) override;

protected:
  void setupRoutes(httplib::Server &server) override;

private:
  void handleEndpointStartRound(const httplib::Request &, httplib::Response &);
  void handleEndpointPartialSum(const httplib::Request &, httplib::Response &);
  void handleEndpointGlobalModel(const httplib::Request &, httplib::Response &);

  // Posts `body` to every endpoint concurrently, retrying until `deadline`
  void broadcast(const std::vector<Endpoint> &peers, const std::string &path,
                 const std::string &body,
                 std::chrono::steady_clock::time_point deadline);

  ConnectionPool connection_pool_;
  RoundCoordinator coordinator_;

  std::atomic<bool> round_running_{false};
  std::mutex round_thread_mutex_;
  std::thread round_thread_;
};

} // namespace hierfed
