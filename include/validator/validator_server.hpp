#pragma once
#include "utils/http_service.hpp"
#include "validator/validator.hpp"

namespace hierfed {

class ValidatorServer : public HttpService {
public:
  ValidatorServer(const DeploymentConfig &config, int index);
  ~ValidatorServer() override;

  Validator &validator() { return validator_; }

protected:
  void setupRoutes(httplib::Server &server) override;

private:
  void handleEndpointValidate(const httplib::Request &, httplib::Response &);

  Validator validator_;
};

} // namespace hierfed
