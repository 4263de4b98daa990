#include "leader/leader_server.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <set>

namespace hierfed {

LeaderServer::LeaderServer(const DeploymentConfig &config)
    : HttpService("leader", config.registry.leader, config),
      connection_pool_(config), coordinator_(config, *this) {}

LeaderServer::~LeaderServer() { stop(); }

void LeaderServer::stop() {
  HttpService::stop();
  std::lock_guard<std::mutex> lock(round_thread_mutex_);
  if (round_thread_.joinable()) {
    round_thread_.join();
  }
}

void LeaderServer::setupRoutes(httplib::Server &server) {
  server.Get("/", [this](const httplib::Request &, httplib::Response &res) {
    auto model = coordinator_.globalModel();
    respondJson(res, {{"role", "leader"},
                      {"id", self_.id},
                      {"model_version", model.version},
                      {"state", std::string(roundStateToString(coordinator_.state()))}});
  });

  // The leader signs nothing, so it advertises no public key
  server.Get("/ready", [this](const httplib::Request &, httplib::Response &res) {
    ReadyResponse ready{"leader", self_.id, "", true};
    respondJson(res, ready);
  });

  server.Post("/start_round",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointStartRound(req, res);
              });

  server.Post("/partial_sum",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointPartialSum(req, res);
              });

  server.Get("/status", [this](const httplib::Request &, httplib::Response &res) {
    respondJson(res, coordinator_.status());
  });

  server.Get("/global_model",
             [this](const httplib::Request &req, httplib::Response &res) {
               this->handleEndpointGlobalModel(req, res);
             });
}

void LeaderServer::handleEndpointStartRound(const httplib::Request &req,
                                            httplib::Response &res) {
  bool expected = false;
  if (!round_running_.compare_exchange_strong(expected, true)) {
    respondError(res, ErrorCode::RoundInProgress, "a round is already in flight");
    return;
  }

  // ?wait=true runs the round on the request thread and reports its outcome
  if (req.get_param_value("wait") == "true") {
    auto outcome = coordinator_.runRound();
    round_running_ = false;
    if (!outcome) {
      respondError(res, outcome.error(), outcome.message());
      return;
    }
    respondJson(res, {{"finalized", true}, {"model_version", outcome.value()}});
    return;
  }

  {
    std::lock_guard<std::mutex> lock(round_thread_mutex_);
    if (round_thread_.joinable()) {
      round_thread_.join();
    }
    round_thread_ = std::thread([this]() {
      auto outcome = coordinator_.runRound();
      if (!outcome) {
        DEBUG_DEBUG("Round ended without a new model: " << outcome.message());
      }
      round_running_ = false;
    });
  }
  respondJson(res, {{"started", true}});
}

void LeaderServer::handleEndpointPartialSum(const httplib::Request &req,
                                            httplib::Response &res) {
  auto partial = parseFogPartialSum(req.body);
  if (!partial) {
    respondInvalid(res, "partial sum");
    return;
  }
  auto result = coordinator_.acceptPartialSum(*partial);
  if (!result) {
    DEBUG_WARN("Rejected partial sum from " << partial->fog_id << ": "
                                            << result.message());
    respondError(res, result.error(), result.message());
    return;
  }
  respondJson(res, {{"received", true}});
}

void LeaderServer::handleEndpointGlobalModel(const httplib::Request &,
                                             httplib::Response &res) {
  auto model = coordinator_.encryptedModel();
  if (!model) {
    res.status = 404;
    res.set_content("{\"error\":\"No finalized model yet\"}", "application/json");
    return;
  }
  respondJson(res, *model);
}

void LeaderServer::broadcast(const std::vector<Endpoint> &peers,
                             const std::string &path, const std::string &body,
                             std::chrono::steady_clock::time_point deadline) {
  std::vector<ConnectionPool::Outbound> requests;
  for (const auto &peer : peers) {
    requests.push_back({peer, body});
  }
  auto results = connection_pool_.postEachUntil(requests, path, deadline);
  for (size_t i = 0; i < results.size(); ++i) {
    if (!results[i]) {
      DEBUG_WARN("Failed to send " << path << " to " << requests[i].peer.id
                                   << ": " << results[i].message());
    } else {
      DEBUG_DEBUG("Sent " << path << " to " << requests[i].peer.id);
    }
  }
}

PeerReadiness LeaderServer::checkReadiness() {
  connection_pool_.cleanupExpiredConnections();
  PeerReadiness readiness;
  std::mutex readiness_mutex;

  auto ask_ready = [&](const Endpoint &peer) {
    auto body = connection_pool_.get(peer, "/ready");
    if (!body) {
      DEBUG_WARN(peer.id << " not reachable: " << body.message());
      return;
    }
    auto ready = parseReadyResponse(body.value());
    if (!ready || !ready->ready || ready->id != peer.id) {
      DEBUG_WARN(peer.id << " reported not ready");
      return;
    }
    std::lock_guard<std::mutex> lock(readiness_mutex);
    if (ready->role == "facility") {
      readiness.facilities.push_back(peer.id);
    } else if (ready->role == "fog") {
      readiness.fog_keys[peer.id] = ready->public_key;
    } else if (ready->role == "validator") {
      readiness.validator_keys[peer.id] = ready->public_key;
    }
  };

  std::vector<std::thread> threads;
  for (const auto &peer : config_.registry.facilities) {
    threads.emplace_back(ask_ready, peer);
  }
  for (const auto &peer : config_.registry.fog_nodes) {
    threads.emplace_back(ask_ready, peer);
  }
  for (const auto &peer : config_.registry.validators) {
    threads.emplace_back(ask_ready, peer);
  }
  for (auto &thread : threads) {
    thread.join();
  }

  LOG("Readiness: " << readiness.facilities.size() << " facilities, "
                    << readiness.fog_keys.size() << " fog nodes, "
                    << readiness.validator_keys.size() << " validators");
  return readiness;
}

Result<std::vector<std::string>> LeaderServer::registeredFacilities() {
  using R = Result<std::vector<std::string>>;
  auto body = connection_pool_.get(config_.registry.authority, "/facilities");
  if (!body) {
    return R(body.error(), body.message());
  }
  auto listing = parseFacilityList(body.value());
  if (!listing) {
    return R(ErrorCode::NetworkInvalidResponse, "malformed facility listing");
  }
  std::vector<std::string> registered;
  for (const auto &identity : listing->facilities) {
    if (identity.registered) {
      registered.push_back(identity.facility_id);
    }
  }
  return registered;
}

void LeaderServer::announceRound(const RoundAnnouncement &announcement,
                                 const PeerReadiness &peers) {
  std::string body = nlohmann::json(announcement).dump();

  std::vector<Endpoint> fogs;
  for (const auto &fog : config_.registry.fog_nodes) {
    if (peers.fog_keys.count(fog.id) != 0) {
      fogs.push_back(fog);
    }
  }
  std::set<std::string> selected(peers.facilities.begin(), peers.facilities.end());
  std::vector<Endpoint> facilities;
  for (const auto &facility : config_.registry.facilities) {
    if (selected.count(facility.id) != 0) {
      facilities.push_back(facility);
    }
  }

  // Fogs answer 503 to shares that overtake their announcement, so both
  // groups are told at once and a slow fog never holds back the facilities
  auto deadline = steadyDeadline(announcement.collection_deadline_ms);
  std::thread fog_dispatch([this, &fogs, &body, deadline]() {
    broadcast(fogs, "/round", body, deadline);
  });
  broadcast(facilities, "/round", body, deadline);
  fog_dispatch.join();
  DEBUG_DEBUG("Announced round " << announcement.round << " to " << fogs.size()
                                 << " fog nodes and " << facilities.size()
                                 << " facilities");
}

void LeaderServer::requestVotes(const ValidationRequest &request,
                                const PeerReadiness &peers,
                                std::chrono::steady_clock::time_point deadline,
                                const std::function<void(const Vote &)> &deliver) {
  std::string body = nlohmann::json(request).dump();
  std::vector<std::thread> threads;
  for (const auto &validator : config_.registry.validators) {
    if (peers.validator_keys.count(validator.id) == 0) {
      continue;
    }
    threads.emplace_back([this, validator, deadline, &body, &deliver]() {
      auto response = connection_pool_.postUntil(validator, "/validate", body,
                                                 deadline);
      if (!response) {
        DEBUG_WARN("No vote from " << validator.id << ": " << response.message());
        return;
      }
      auto vote = parseVote(response.value());
      if (!vote) {
        DEBUG_WARN("Malformed vote from " << validator.id);
        return;
      }
      deliver(*vote);
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
}

Result<AttributePublicParams> LeaderServer::fetchPublicParams() {
  auto body = connection_pool_.get(config_.registry.authority, "/public_params");
  if (!body) {
    return Result<AttributePublicParams>(body.error(), body.message());
  }
  auto params = parsePublicParams(body.value());
  if (!params) {
    return Result<AttributePublicParams>(ErrorCode::NetworkInvalidResponse,
                                         "malformed public parameters");
  }
  return params->attributes;
}

void LeaderServer::publishModel(const EncryptedModel &model) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.broadcast_timeout_ms);
  broadcast(config_.registry.facilities, "/global_model",
            nlohmann::json(model).dump(), deadline);
}

} // namespace hierfed
