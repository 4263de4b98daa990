#include "utils/http_service.hpp"
#include "utils/logging.hpp"
#include <chrono>

namespace hierfed {

HttpService::HttpService(std::string role, const Endpoint &self,
                         const DeploymentConfig &config)
    : role_(std::move(role)), self_(self), config_(config) {}

HttpService::~HttpService() { stop(); }

std::unique_ptr<httplib::Server> HttpService::createServer() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
  if (config_.use_tls) {
    LOG("Starting " << role_ << " " << self_.id << " on https://" << self_.host
                    << ":" << self_.port);
    return std::make_unique<httplib::SSLServer>(config_.cert_file.c_str(),
                                                config_.private_key_file.c_str());
  }
#endif
  LOG("Starting " << role_ << " " << self_.id << " on http://" << self_.host
                  << ":" << self_.port);
  return std::make_unique<httplib::Server>();
}

void HttpService::start() {
  if (!svr_) {
    svr_ = createServer();
    setupRoutes(*svr_);
  }
  if (!svr_->listen(self_.host, self_.port)) {
    LOG("Failed to listen on " << self_.host << ":" << self_.port);
  }
}

void HttpService::startInBackground() {
  svr_ = createServer();
  setupRoutes(*svr_);
  listen_thread_ = std::thread([this]() { start(); });
  svr_->wait_until_ready();
}

void HttpService::stop() {
  if (svr_) {
    svr_->stop();
  }
  if (listen_thread_.joinable()) {
    listen_thread_.join();
  }
}

} // namespace hierfed
