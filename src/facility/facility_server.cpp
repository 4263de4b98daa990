#include "facility/facility_server.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"

namespace hierfed {

FacilityServer::FacilityServer(const DeploymentConfig &config, int index,
                               std::unique_ptr<TrainingModule> training)
    : HttpService("facility", config.registry.facilities.at(index), config),
      facility_(config, config.registry.facilities.at(index), std::move(training)),
      connection_pool_(config) {}

FacilityServer::~FacilityServer() { stop(); }

void FacilityServer::stop() {
  HttpService::stop();
  workers_.joinAll();
}

void FacilityServer::setupRoutes(httplib::Server &server) {
  server.Get("/", [this](const httplib::Request &, httplib::Response &res) {
    auto model = facility_.model();
    respondJson(res, {{"role", "facility"},
                      {"id", self_.id},
                      {"registered", facility_.isRegistered()},
                      {"model_version", model.version},
                      {"rounds_contributed", facility_.ledger().roundsSpent()}});
  });

  server.Get("/ready", [this](const httplib::Request &, httplib::Response &res) {
    ReadyResponse ready{"facility", self_.id, facility_.publicKey(),
                        facility_.isRegistered()};
    respondJson(res, ready);
  });

  server.Post("/register",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointRegister(req, res);
              });

  server.Post("/start_round",
              [this](const httplib::Request &req, httplib::Response &res) {
                DEBUG_INFO("START_ROUND: Received " << req.body.size()
                                                    << " bytes of local data");
                this->handleEndpointStartRound(req, res);
              });

  server.Post("/round",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointRound(req, res);
              });

  server.Post("/global_model",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointGlobalModel(req, res);
              });
}

Result<std::string> FacilityServer::fetchAuthorityKey() {
  {
    std::lock_guard<std::mutex> lock(ta_key_mutex_);
    if (!ta_public_key_.empty()) {
      return ta_public_key_;
    }
  }
  auto body = connection_pool_.get(config_.registry.authority, "/public_params");
  if (!body) {
    return Result<std::string>(body.error(), body.message());
  }
  auto params = parsePublicParams(body.value());
  if (!params) {
    return Result<std::string>(ErrorCode::NetworkInvalidResponse,
                               "malformed public parameters");
  }
  std::lock_guard<std::mutex> lock(ta_key_mutex_);
  ta_public_key_ = params->ta_public_key;
  return ta_public_key_;
}

Result<Identity> FacilityServer::bootstrap() {
  using R = Result<Identity>;
  auto ta_key = fetchAuthorityKey();
  if (!ta_key) {
    return R(ta_key.error(), ta_key.message());
  }

  auto challenge_body = connection_pool_.get(
      config_.registry.authority, "/challenge?facility_id=" + self_.id);
  if (!challenge_body) {
    return R(challenge_body.error(), challenge_body.message());
  }
  auto challenge = parseChallengeResponse(challenge_body.value());
  if (!challenge) {
    return R(ErrorCode::NetworkInvalidResponse, "malformed challenge");
  }

  auto request = facility_.solveChallenge(*challenge);
  if (!request) {
    return R(request.error(), request.message());
  }

  nlohmann::json j = request.value();
  auto identity_body =
      connection_pool_.post(config_.registry.authority, "/register", j.dump());
  if (!identity_body) {
    LOG("Facility " << self_.id << " registration failed: "
                    << identity_body.message());
    return R(ErrorCode::RegistrationRejected, identity_body.message());
  }
  auto identity = parseIdentity(identity_body.value());
  if (!identity) {
    return R(ErrorCode::NetworkInvalidResponse, "malformed identity");
  }

  auto accepted = facility_.acceptIdentity(*identity, ta_key.value());
  if (!accepted) {
    return R(accepted.error(), accepted.message());
  }
  return *identity;
}

Result<void> FacilityServer::refreshKeys() {
  auto ta_key = fetchAuthorityKey();
  if (!ta_key) {
    return Result<void>(ta_key.error(), ta_key.message());
  }
  nlohmann::json j = facility_.signedRefreshRequest();
  auto body =
      connection_pool_.post(config_.registry.authority, "/refresh_keys", j.dump());
  if (!body) {
    return Result<void>(body.error(), body.message());
  }
  auto identity = parseIdentity(body.value());
  if (!identity) {
    return Result<void>(ErrorCode::NetworkInvalidResponse, "malformed identity");
  }
  return facility_.acceptIdentity(*identity, ta_key.value());
}

void FacilityServer::handleEndpointRegister(const httplib::Request &,
                                            httplib::Response &res) {
  if (facility_.isRegistered()) {
    respondError(res, ErrorCode::RegistrationDuplicateFacility,
                 self_.id + " is already registered");
    return;
  }
  auto identity = bootstrap();
  if (!identity) {
    respondError(res, identity.error(), identity.message());
    return;
  }
  respondJson(res, {{"registered", true},
                    {"facility_id", identity.value().facility_id},
                    {"key_epoch", identity.value().key_epoch}});
}

void FacilityServer::handleEndpointStartRound(const httplib::Request &req,
                                              httplib::Response &res) {
  if (!parseFloat64Payload(req.body)) {
    respondInvalid(res, "float64 payload");
    return;
  }
  facility_.setLocalData(req.body);
  bool ready = facility_.readyToContribute();
  if (ready) {
    contributeIfReady();
  }
  respondJson(res, {{"received", true}, {"contributing", ready}});
}

void FacilityServer::handleEndpointRound(const httplib::Request &req,
                                         httplib::Response &res) {
  auto announcement = parseRoundAnnouncement(req.body);
  if (!announcement) {
    respondInvalid(res, "round announcement");
    return;
  }
  auto result = facility_.announceRound(*announcement);
  if (!result) {
    respondError(res, result.error(), result.message());
    return;
  }
  bool ready = facility_.readyToContribute();
  if (ready) {
    contributeIfReady();
  }
  respondJson(res, {{"received", true}, {"contributing", ready}});
}

void FacilityServer::handleEndpointGlobalModel(const httplib::Request &req,
                                               httplib::Response &res) {
  auto model = parseEncryptedModel(req.body);
  if (!model) {
    respondInvalid(res, "encrypted model");
    return;
  }
  auto view = facility_.receiveModel(*model);
  if (!view && view.error() == ErrorCode::CryptoKeyEpochMismatch) {
    LOG("Facility " << self_.id << " refreshing attribute keys for epoch "
                    << model->payload.epoch);
    auto refreshed = refreshKeys();
    if (refreshed) {
      view = facility_.receiveModel(*model);
    } else {
      DEBUG_WARN("Key refresh failed: " << refreshed.message());
    }
  }
  if (!view) {
    respondError(res, view.error(), view.message());
    return;
  }
  respondJson(res, {{"installed", true}, {"version", view.value().version}});
}

void FacilityServer::contributeIfReady() {
  auto shares = facility_.prepareContribution();
  if (!shares) {
    LOG("Facility " << self_.id << " cannot contribute: " << shares.message());
    return;
  }
  auto round = facility_.currentRound();
  int64_t deadline_ms = round ? round->collection_deadline_ms : unixMillis();

  workers_.spawn([this, messages = shares.moveValue(), deadline_ms]() mutable {
    deliverShares(std::move(messages), deadline_ms);
  });
}

void FacilityServer::deliverShares(std::vector<ShareMessage> shares,
                                   int64_t deadline_ms) {
  std::vector<ConnectionPool::Outbound> requests;
  for (const auto &share : shares) {
    if (share.fog_index < 0 ||
        share.fog_index >= static_cast<int>(config_.registry.fog_nodes.size())) {
      DEBUG_ERROR("Share addressed to unknown fog index " << share.fog_index);
      continue;
    }
    requests.push_back({config_.registry.fog_nodes[share.fog_index],
                        nlohmann::json(share).dump()});
  }

  auto results =
      connection_pool_.postEachUntil(requests, "/share", steadyDeadline(deadline_ms));
  for (size_t i = 0; i < results.size(); ++i) {
    const Endpoint &fog = requests[i].peer;
    if (!results[i]) {
      // Losing up to n - t fog nodes does not block the round
      LOG("Facility " << self_.id << " could not deliver share to " << fog.id
                      << ": " << results[i].message());
    } else {
      DEBUG_DEBUG("Delivered share to " << fog.id);
    }
  }
}

} // namespace hierfed
