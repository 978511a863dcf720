#pragma once

#include <cstdint>
#include <string>

namespace tallykeep::config {

struct UsageStatisticsConfig {
  bool enabled = true;
  std::string persist_file;
  std::string save_interval = "5m";
  bool restore_on_start = true;
};

struct GatewayConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8317;
  std::string local_management_password;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  UsageStatisticsConfig usage_statistics;
  GatewayConfig gateway;
  ObservabilityConfig observability;
};

} // namespace tallykeep::config
