#pragma once

#include "tallykeep/common/result.hpp"
#include "tallykeep/config/schema.hpp"
#include "tallykeep/runtime/cancellation.hpp"
#include "tallykeep/runtime/service.hpp"
#include "tallykeep/usage/statistics.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace tallykeep::runtime {

inline constexpr std::chrono::milliseconds kDefaultKeepAliveTimeout{10000};

struct LifecycleOptions {
  /// Enables the keep-alive endpoint and its idle shutdown when non-empty.
  std::string local_password;
  bool handle_signals = true;
  std::chrono::milliseconds keepalive_timeout = kDefaultKeepAliveTimeout;
  /// Supplied by callers that want to trigger shutdown themselves; created
  /// internally otherwise.
  std::shared_ptr<CancellationSource> cancellation;
  /// Runs after persistence has started.
  std::function<void(Service &)> on_started;
};

/// Builds the service, runs it until a shutdown trigger fires, and keeps the
/// usage file in step: restore after the service exists, periodic saves while
/// it runs, and a final save once it has returned.
///
/// Returns success after a normal shutdown and an error when the service
/// could not be built or failed while running.
[[nodiscard]] common::Status run_service(const config::Config &config,
                                         const LifecycleOptions &options);

} // namespace tallykeep::runtime
