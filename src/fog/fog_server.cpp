#include "fog/fog_server.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"

namespace hierfed {

FogServer::FogServer(const DeploymentConfig &config, int index)
    : HttpService("fog node", config.registry.fog_nodes.at(index), config),
      aggregator_(config, index), connection_pool_(config) {}

FogServer::~FogServer() { stop(); }

void FogServer::stop() {
  aggregator_.shutdown();
  HttpService::stop();
  timers_.joinAll();
}

void FogServer::setupRoutes(httplib::Server &server) {
  server.Get("/", [this](const httplib::Request &, httplib::Response &res) {
    auto round = aggregator_.currentRound();
    respondJson(res, {{"role", "fog"},
                      {"id", self_.id},
                      {"x", aggregator_.evaluationPoint()},
                      {"round", round ? round->round : 0},
                      {"shares", aggregator_.sharesReceived()}});
  });

  server.Get("/ready", [this](const httplib::Request &, httplib::Response &res) {
    ReadyResponse ready{"fog", self_.id, aggregator_.publicKey(),
                        ensureAuthorityKey()};
    respondJson(res, ready);
  });

  server.Post("/round",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointRound(req, res);
              });

  server.Post("/share",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointShare(req, res);
              });
}

bool FogServer::ensureAuthorityKey() {
  if (aggregator_.hasAuthorityKey()) {
    return true;
  }
  auto body = connection_pool_.get(config_.registry.authority, "/public_params");
  if (!body) {
    DEBUG_WARN("Fog " << self_.id << " cannot reach authority: "
                      << body.message());
    return false;
  }
  auto params = parsePublicParams(body.value());
  if (!params) {
    return false;
  }
  aggregator_.setAuthorityKey(params->ta_public_key);
  return true;
}

void FogServer::handleEndpointRound(const httplib::Request &req,
                                    httplib::Response &res) {
  auto announcement = parseRoundAnnouncement(req.body);
  if (!announcement) {
    respondInvalid(res, "round announcement");
    return;
  }
  if (!ensureAuthorityKey()) {
    respondError(res, ErrorCode::ProtocolNotReady, "authority key unavailable");
    return;
  }
  auto result = aggregator_.announceRound(*announcement);
  if (!result) {
    respondError(res, result.error(), result.message());
    return;
  }

  RoundAnnouncement round = *announcement;
  timers_.spawn([this, round]() { runRoundTimer(round); });
  respondJson(res, {{"received", true}, {"round", announcement->round}});
}

void FogServer::handleEndpointShare(const httplib::Request &req,
                                    httplib::Response &res) {
  auto share = parseShareMessage(req.body);
  if (!share) {
    respondInvalid(res, "share");
    return;
  }
  auto result = aggregator_.acceptShare(*share);
  if (!result) {
    DEBUG_WARN("Rejected share from " << share->facility_id << ": "
                                      << result.message());
    respondError(res, result.error(), result.message());
    return;
  }
  respondJson(res, {{"received", true}});
}

void FogServer::runRoundTimer(RoundAnnouncement announcement) {
  bool complete =
      aggregator_.waitForShares(steadyDeadline(announcement.collection_deadline_ms));
  DEBUG_INFO("Fog " << self_.id << " closing round " << announcement.round
                    << (complete ? " (all shares in)" : " (deadline)"));

  auto partial = aggregator_.finalizeRound(announcement.round);
  if (!partial) {
    DEBUG_WARN("No partial sum for round " << announcement.round << ": "
                                           << partial.message());
    return;
  }

  nlohmann::json j = partial.value();
  auto sent = connection_pool_.postUntil(
      config_.registry.leader, "/partial_sum", j.dump(),
      steadyDeadline(announcement.reconstruction_deadline_ms));
  if (!sent) {
    LOG("Fog " << self_.id << " could not forward partial sum for round "
               << announcement.round << ": " << sent.message());
    return;
  }
  DEBUG_DEBUG("Forwarded partial sum for round " << announcement.round);
}

} // namespace hierfed
