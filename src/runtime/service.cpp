#include "tallykeep/runtime/service.hpp"

#include "tallykeep/config/config.hpp"
#include "tallykeep/health/health.hpp"

namespace tallykeep::runtime {

common::Result<std::unique_ptr<Service>> Service::build(ServiceOptions options,
                                                         usage::UsageStatistics &statistics) {
  auto validated = config::validate_config(options.config);
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<Service>>::failure(validated.error());
  }
  return common::Result<std::unique_ptr<Service>>::success(
      std::unique_ptr<Service>(new Service(std::move(options), statistics)));
}

Service::Service(ServiceOptions options, usage::UsageStatistics &statistics)
    : options_(std::move(options)), statistics_(statistics) {
  gateway::GatewayOptions gateway_options;
  gateway_options.host = options_.config.gateway.host;
  gateway_options.port = options_.config.gateway.port;
  gateway_options.local_password = options_.local_password;
  gateway_options.keepalive_timeout = options_.keepalive_timeout;
  gateway_options.on_keepalive_idle = options_.on_keepalive_idle;
  gateway_ = std::make_unique<gateway::GatewayServer>(std::move(gateway_options), statistics_);
}

Service::~Service() = default;

common::Status Service::run(CancellationSource &cancellation) {
  auto started = gateway_->start();
  if (!started.ok()) {
    health::mark_component_error(gateway::kGatewayComponent, started.error());
    return common::Status::error("gateway: " + started.error());
  }

  if (options_.hooks.on_after_start) {
    options_.hooks.on_after_start(*this);
  }

  cancellation.wait();
  gateway_->stop();
  return common::Status::cancelled(cancellation.cause());
}

} // namespace tallykeep::runtime
