#pragma once
#include "authority/trusted_authority.hpp"
#include "utils/http_service.hpp"

namespace hierfed {

class AuthorityServer : public HttpService {
public:
  explicit AuthorityServer(const DeploymentConfig &config);
  ~AuthorityServer() override;

  TrustedAuthority &authority() { return authority_; }

protected:
  void setupRoutes(httplib::Server &server) override;

private:
  void handleEndpointChallenge(const httplib::Request &, httplib::Response &);
  void handleEndpointRegister(const httplib::Request &, httplib::Response &);
  void handleEndpointRefreshKeys(const httplib::Request &, httplib::Response &);
  void handleEndpointRevoke(const httplib::Request &, httplib::Response &);

  TrustedAuthority authority_;
};

} // namespace hierfed
