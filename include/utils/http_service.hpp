#pragma once
#include "config/deployment_config.hpp"
#include "utils/error_codes.hpp"
#include <atomic>
#include <httplib.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <thread>

namespace hierfed {

inline void respondJson(httplib::Response &res, const nlohmann::json &body) {
  res.status = 200;
  res.set_content(body.dump(), "application/json");
}

inline void respondError(httplib::Response &res, ErrorCode code,
                         std::string_view message) {
  res.status = httpStatusFor(code);
  nlohmann::json body = {{"error", std::string(errorToString(code))},
                         {"code", static_cast<uint32_t>(code)},
                         {"message", std::string(message)}};
  res.set_content(body.dump(), "application/json");
}

inline void respondInvalid(httplib::Response &res, std::string_view what) {
  respondError(res, ErrorCode::ProtocolInvalidMessage,
               std::string("Invalid ") + std::string(what));
}

// HTTP(S) listener shared by every role. Subclasses register their routes;
// SSLServer derives from Server so one route table serves both.
class HttpService {
public:
  HttpService(std::string role, const Endpoint &self,
              const DeploymentConfig &config);
  virtual ~HttpService();

  HttpService(const HttpService &) = delete;
  HttpService &operator=(const HttpService &) = delete;

  // Blocks until stop() is called
  void start();

  // Runs start() on a background thread and waits until the socket is bound
  void startInBackground();

  virtual void stop();

  const Endpoint &endpoint() const { return self_; }
  bool isRunning() const { return svr_ && svr_->is_running(); }

protected:
  virtual void setupRoutes(httplib::Server &server) = 0;

  std::string role_;
  Endpoint self_;
  const DeploymentConfig config_;

private:
  std::unique_ptr<httplib::Server> createServer();

  std::unique_ptr<httplib::Server> svr_;
  std::thread listen_thread_;
};

} // namespace hierfed
