#pragma once
#include "config/deployment_config.hpp"
#include "utils/error_codes.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace hierfed {

// Reuses HTTP clients per peer and retries transient failures with
// exponential backoff until the caller's phase deadline.
class ConnectionPool {
private:
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    using ClientVariant = std::variant<std::unique_ptr<httplib::Client>, std::unique_ptr<httplib::SSLClient>>;
#else
    using ClientVariant = std::variant<std::unique_ptr<httplib::Client>>;
#endif

    struct PooledConnection {
        ClientVariant client;
        std::chrono::steady_clock::time_point last_used;
        std::mutex use_mutex;

        PooledConnection(const std::string& host, int port, bool use_tls,
                         int connection_timeout_ms, int read_timeout_ms) {
            auto connect_timeout = std::chrono::milliseconds(connection_timeout_ms);
            auto read_timeout = std::chrono::milliseconds(read_timeout_ms);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
            if (use_tls) {
                auto ssl_client = std::make_unique<httplib::SSLClient>(host, port);
                ssl_client->enable_server_certificate_verification(false);
                ssl_client->set_connection_timeout(connect_timeout);
                ssl_client->set_read_timeout(read_timeout);
                ssl_client->set_write_timeout(read_timeout);
                client = std::move(ssl_client);
                last_used = std::chrono::steady_clock::now();
                return;
            }
#else
            (void)use_tls;
#endif
            auto http_client = std::make_unique<httplib::Client>(host, port);
            http_client->set_connection_timeout(connect_timeout);
            http_client->set_read_timeout(read_timeout);
            http_client->set_write_timeout(read_timeout);
            client = std::move(http_client);
            last_used = std::chrono::steady_clock::now();
        }

        bool isExpired(int timeout_seconds) const {
            auto now = std::chrono::steady_clock::now();
            auto age = std::chrono::duration_cast<std::chrono::seconds>(now - last_used);
            return age.count() >= timeout_seconds;
        }
    };

    std::unordered_map<std::string, std::shared_ptr<PooledConnection>> connections_;
    std::shared_mutex connections_mutex_;

    static constexpr int CONNECTION_TIMEOUT_SECONDS = 60;
    bool use_tls_ = false;
    int connection_timeout_ms_ = 2000;
    int read_timeout_ms_ = 5000;
    int initial_backoff_ms_ = 100;
    int max_backoff_ms_ = 2000;

    std::string makeKey(const std::string& host, int port) const {
        return host + ":" + std::to_string(port);
    }

    std::shared_ptr<PooledConnection> acquire(const std::string& host, int port) {
        std::string key = makeKey(host, port);
        {
            std::shared_lock<std::shared_mutex> lock(connections_mutex_);
            auto it = connections_.find(key);
            if (it != connections_.end() && !it->second->isExpired(CONNECTION_TIMEOUT_SECONDS)) {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(connections_mutex_);
        auto it = connections_.find(key);
        if (it == connections_.end() || it->second->isExpired(CONNECTION_TIMEOUT_SECONDS)) {
            connections_[key] = std::make_shared<PooledConnection>(
                host, port, use_tls_, connection_timeout_ms_, read_timeout_ms_);
        }
        return connections_[key];
    }

public:
    ConnectionPool() = default;

    explicit ConnectionPool(const DeploymentConfig& config)
        : use_tls_(config.use_tls),
          connection_timeout_ms_(config.connection_timeout_ms),
          read_timeout_ms_(config.read_timeout_ms),
          initial_backoff_ms_(config.retry_initial_backoff_ms),
          max_backoff_ms_(config.retry_max_backoff_ms) {}

    template<typename Func>
    auto withConnection(const std::string& host, int port, Func&& func) -> decltype(func(std::declval<httplib::Client*>())) {
        auto conn = acquire(host, port);
        // httplib clients are not safe for concurrent requests
        std::lock_guard<std::mutex> use_lock(conn->use_mutex);
        conn->last_used = std::chrono::steady_clock::now();

        // Call the function with the appropriate client type
        return std::visit([&func](auto& client) {
            return func(client.get());
        }, conn->client);
    }

    // Single attempt; returns the response body on HTTP 200
    Result<std::string> post(const Endpoint& peer, const std::string& path,
                             const std::string& body,
                             const std::string& content_type = "application/json") {
        try {
            return withConnection(peer.host, peer.port, [&](auto* client) -> Result<std::string> {
                auto res = client->Post(path, body, content_type);
                if (!res) {
                    return Result<std::string>(ErrorCode::NetworkConnectionFailed,
                                               "no response from " + peer.id + path);
                }
                // 503: the peer is up but has not reached this phase yet
                if (res->status == 503) {
                    return Result<std::string>(ErrorCode::ProtocolNotReady,
                                               peer.id + path + " not ready: " + res->body);
                }
                if (res->status != 200) {
                    return Result<std::string>(ErrorCode::NetworkInvalidResponse,
                                               peer.id + path + " returned " + std::to_string(res->status) + ": " + res->body);
                }
                return Result<std::string>(res->body);
            });
        } catch (const std::exception& e) {
            return Result<std::string>(ErrorCode::NetworkConnectionFailed, e.what());
        }
    }

    Result<std::string> get(const Endpoint& peer, const std::string& path) {
        try {
            return withConnection(peer.host, peer.port, [&](auto* client) -> Result<std::string> {
                auto res = client->Get(path);
                if (!res) {
                    return Result<std::string>(ErrorCode::NetworkConnectionFailed,
                                               "no response from " + peer.id + path);
                }
                if (res->status != 200) {
                    return Result<std::string>(ErrorCode::NetworkInvalidResponse,
                                               peer.id + path + " returned " + std::to_string(res->status) + ": " + res->body);
                }
                return Result<std::string>(res->body);
            });
        } catch (const std::exception& e) {
            return Result<std::string>(ErrorCode::NetworkConnectionFailed, e.what());
        }
    }

    // Retries connection failures and 503 answers until `deadline`. Any other
    // non-200 answer is the peer's verdict and is returned without retrying.
    Result<std::string> postUntil(const Endpoint& peer, const std::string& path,
                                  const std::string& body,
                                  std::chrono::steady_clock::time_point deadline,
                                  const std::string& content_type = "application/json") {
        int backoff_ms = initial_backoff_ms_;
        int attempt = 0;
        while (true) {
            ++attempt;
            auto result = post(peer, path, body, content_type);
            if (result.isSuccess() ||
                (result.error() != ErrorCode::NetworkConnectionFailed &&
                 result.error() != ErrorCode::ProtocolNotReady)) {
                return result;
            }

            if (result.error() == ErrorCode::NetworkConnectionFailed) {
                removeConnection(peer.host, peer.port);
            }
            auto now = std::chrono::steady_clock::now();
            if (now + std::chrono::milliseconds(backoff_ms) >= deadline) {
                DEBUG_WARN("Giving up on " << peer.id << path << " after " << attempt << " attempts");
                return Result<std::string>(ErrorCode::NetworkTimeout,
                                           "deadline reached sending to " + peer.id + path);
            }
            DEBUG_DEBUG("Retrying " << peer.id << path << " in " << backoff_ms << "ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms = std::min(backoff_ms * 2, max_backoff_ms_);
        }
    }

    struct Outbound {
        Endpoint peer;
        std::string body;
    };

    // One thread per request, each retried until `deadline`, so an unreachable
    // peer never delays the others. Results are in request order.
    std::vector<Result<std::string>> postEachUntil(const std::vector<Outbound>& requests,
                                                   const std::string& path,
                                                   std::chrono::steady_clock::time_point deadline) {
        std::vector<Result<std::string>> results(
            requests.size(), Result<std::string>(ErrorCode::NetworkConnectionFailed));
        std::vector<std::thread> threads;
        threads.reserve(requests.size());
        for (size_t i = 0; i < requests.size(); ++i) {
            threads.emplace_back([this, &requests, &results, &path, deadline, i]() {
                results[i] = postUntil(requests[i].peer, path, requests[i].body, deadline);
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        return results;
    }

    void removeConnection(const std::string& host, int port) {
        std::string key = makeKey(host, port);
        std::unique_lock<std::shared_mutex> lock(connections_mutex_);
        connections_.erase(key);
    }

    void cleanupExpiredConnections() {
        std::vector<std::string> expired_keys;

        {
            std::shared_lock<std::shared_mutex> lock(connections_mutex_);
            for (const auto& [key, conn] : connections_) {
                if (conn->isExpired(CONNECTION_TIMEOUT_SECONDS)) {
                    expired_keys.push_back(key);
                }
            }
        }

        if (!expired_keys.empty()) {
            std::unique_lock<std::shared_mutex> lock(connections_mutex_);
            for (const std::string& key : expired_keys) {
                connections_.erase(key);
            }
        }
    }
};

} // namespace hierfed
