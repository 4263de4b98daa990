#include "authority/authority_server.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"

namespace hierfed {

AuthorityServer::AuthorityServer(const DeploymentConfig &config)
    : HttpService("trusted authority", config.registry.authority, config),
      authority_(config) {}

AuthorityServer::~AuthorityServer() { stop(); }

void AuthorityServer::setupRoutes(httplib::Server &server) {
  server.Get("/", [this](const httplib::Request &, httplib::Response &res) {
    respondJson(res, {{"role", "authority"},
                      {"id", self_.id},
                      {"registered", authority_.facilities().size()},
                      {"key_epoch", authority_.keyEpoch()}});
  });

  server.Get("/challenge",
             [this](const httplib::Request &req, httplib::Response &res) {
               this->handleEndpointChallenge(req, res);
             });

  server.Post("/register",
              [this](const httplib::Request &req, httplib::Response &res) {
                DEBUG_INFO("REGISTER: Received data: " << req.body);
                this->handleEndpointRegister(req, res);
              });

  server.Get("/public_params",
             [this](const httplib::Request &, httplib::Response &res) {
               respondJson(res, authority_.publicParams());
             });

  server.Post("/refresh_keys",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointRefreshKeys(req, res);
              });

  server.Post("/revoke",
              [this](const httplib::Request &req, httplib::Response &res) {
                this->handleEndpointRevoke(req, res);
              });

  server.Get("/facilities",
             [this](const httplib::Request &, httplib::Response &res) {
               respondJson(res, FacilityList{authority_.facilities()});
             });
}

void AuthorityServer::handleEndpointChallenge(const httplib::Request &req,
                                              httplib::Response &res) {
  std::string facility_id = req.get_param_value("facility_id");
  auto result = authority_.issueChallenge(facility_id);
  if (!result) {
    respondError(res, result.error(), result.message());
    return;
  }
  respondJson(res, result.value());
}

void AuthorityServer::handleEndpointRegister(const httplib::Request &req,
                                             httplib::Response &res) {
  auto request = parseRegistrationRequest(req.body);
  if (!request) {
    respondInvalid(res, "registration request");
    return;
  }
  auto result = authority_.registerFacility(*request);
  if (!result) {
    respondError(res, result.error(), result.message());
    return;
  }
  respondJson(res, result.value());
}

void AuthorityServer::handleEndpointRefreshKeys(const httplib::Request &req,
                                                httplib::Response &res) {
  auto request = parseRefreshKeysRequest(req.body);
  if (!request) {
    respondInvalid(res, "refresh request");
    return;
  }
  auto result = authority_.refreshKeys(*request);
  if (!result) {
    respondError(res, result.error(), result.message());
    return;
  }
  respondJson(res, result.value());
}

void AuthorityServer::handleEndpointRevoke(const httplib::Request &req,
                                           httplib::Response &res) {
  auto request = parseRevokeRequest(req.body);
  if (!request) {
    respondInvalid(res, "revoke request");
    return;
  }
  auto result = authority_.revoke(request->facility_id);
  if (!result) {
    respondError(res, result.error(), result.message());
    return;
  }
  respondJson(res, {{"revoked", request->facility_id},
                    {"key_epoch", authority_.keyEpoch()}});
}

} // namespace hierfed
