#pragma once

#include "tallykeep/common/result.hpp"
#include "tallykeep/config/schema.hpp"
#include "tallykeep/gateway/server.hpp"
#include "tallykeep/runtime/cancellation.hpp"
#include "tallykeep/usage/statistics.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace tallykeep::runtime {

class Service;

struct ServiceHooks {
  /// Runs once the gateway is listening, before run() blocks.
  std::function<void(Service &)> on_after_start;
};

struct ServiceOptions {
  config::Config config;
  ServiceHooks hooks;
  std::string local_password;
  std::chrono::milliseconds keepalive_timeout{10000};
  std::function<void()> on_keepalive_idle;
};

/// The long-running proxy service: a gateway fronting a statistics store.
class Service {
public:
  /// Validates the configuration and constructs the gateway. Nothing is bound
  /// or started until run().
  [[nodiscard]] static common::Result<std::unique_ptr<Service>>
  build(ServiceOptions options, usage::UsageStatistics &statistics);

  ~Service();

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  /// Blocks until `cancellation` fires. Returns Status::cancelled() for a
  /// normal shutdown and an error when the service could not run.
  [[nodiscard]] common::Status run(CancellationSource &cancellation);

  [[nodiscard]] usage::UsageStatistics &statistics() { return statistics_; }
  [[nodiscard]] gateway::GatewayServer &gateway() { return *gateway_; }
  [[nodiscard]] const config::Config &config() const { return options_.config; }

private:
  Service(ServiceOptions options, usage::UsageStatistics &statistics);

  ServiceOptions options_;
  usage::UsageStatistics &statistics_;
  std::unique_ptr<gateway::GatewayServer> gateway_;
};

} // namespace tallykeep::runtime
