#pragma once

#include "tallykeep/common/result.hpp"
#include "tallykeep/gateway/keepalive.hpp"
#include "tallykeep/usage/statistics.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace tallykeep::gateway {

inline constexpr const char *kGatewayComponent = "gateway";

struct GatewayOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8317;
  /// Enables GET /keep-alive when non-empty.
  std::string local_password;
  std::chrono::milliseconds keepalive_timeout{10000};
  std::function<void()> on_keepalive_idle;
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

class GatewayServer {
public:
  GatewayServer(GatewayOptions options, usage::UsageStatistics &statistics);
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  [[nodiscard]] common::Status start();
  void stop();

  [[nodiscard]] std::uint16_t port() const { return bound_port_; }
  [[nodiscard]] bool is_running() const { return running_.load(); }
  [[nodiscard]] bool keepalive_enabled() const { return keepalive_ != nullptr; }

  [[nodiscard]] HttpResponse dispatch(const HttpRequest &request);

private:
  [[nodiscard]] HttpResponse handle_health(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_usage_get(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_usage_post(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_keepalive(const HttpRequest &request);

  [[nodiscard]] bool authorized(const HttpRequest &request) const;

  void accept_loop();
  void handle_client(int client_fd);

  GatewayOptions options_;
  usage::UsageStatistics &statistics_;
  std::string password_hash_;
  std::unique_ptr<KeepAliveMonitor> keepalive_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::mutex client_mutex_;
  int client_fd_ = -1;
  std::uint16_t bound_port_ = 0;
};

} // namespace tallykeep::gateway
