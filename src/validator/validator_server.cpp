#include "validator/validator_server.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"

namespace hierfed {

ValidatorServer::ValidatorServer(const DeploymentConfig &config, int index)
    : HttpService("validator", config.registry.validators.at(index), config),
      validator_(config, index) {}

ValidatorServer::~ValidatorServer() { stop(); }

void ValidatorServer::setupRoutes(httplib::Server &server) {
  server.Get("/", [this](const httplib::Request &, httplib::Response &res) {
    respondJson(res, {{"role", "validator"},
                      {"id", self_.id},
                      {"votes_cast", validator_.votesCast()}});
  });

  server.Get("/ready", [this](const httplib::Request &, httplib::Response &res) {
    ReadyResponse ready{"validator", self_.id, validator_.publicKey(), true};
    respondJson(res, ready);
  });

  server.Post("/validate",
              [this](const httplib::Request &req, httplib::Response &res) {
                DEBUG_INFO("VALIDATE: Received " << req.body.size() << " bytes");
                this->handleEndpointValidate(req, res);
              });
}

void ValidatorServer::handleEndpointValidate(const httplib::Request &req,
                                             httplib::Response &res) {
  auto request = parseValidationRequest(req.body);
  if (!request) {
    respondInvalid(res, "validation request");
    return;
  }
  auto vote = validator_.validate(*request);
  if (!vote) {
    respondError(res, vote.error(), vote.message());
    return;
  }
  respondJson(res, vote.value());
}

} // namespace hierfed
