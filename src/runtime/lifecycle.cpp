#include "tallykeep/runtime/lifecycle.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/config/config.hpp"
#include "tallykeep/observability/global.hpp"
#include "tallykeep/runtime/signal_watcher.hpp"
#include "tallykeep/usage/file_persister.hpp"

#include <iostream>

namespace tallykeep::runtime {

common::Status run_service(const config::Config &config, const LifecycleOptions &options) {
  auto cancellation = options.cancellation != nullptr ? options.cancellation
                                                      : std::make_shared<CancellationSource>();

  // Must precede every other thread so the signals only reach the watcher.
  SignalWatcher signals(cancellation);
  if (options.handle_signals) {
    auto watching = signals.start();
    if (!watching.ok()) {
      return watching;
    }
  }

  usage::UsageStatistics statistics;
  statistics.set_enabled(config.usage_statistics.enabled);

  std::unique_ptr<usage::FilePersister> persister;
  const std::string persist_file = common::trim(config.usage_statistics.persist_file);
  if (!persist_file.empty()) {
    const auto interval = config::parse_save_interval(config.usage_statistics.save_interval);
    if (interval.warning.has_value()) {
      observability::record_warning("usage", *interval.warning);
    }
    persister = std::make_unique<usage::FilePersister>(
        usage::FilePersisterOptions{.file_path = persist_file,
                                    .interval = interval.interval,
                                    .restore_on_start = config.usage_statistics.restore_on_start},
        &statistics);
  }

  ServiceOptions service_options;
  service_options.config = config;
  service_options.local_password = options.local_password;
  service_options.keepalive_timeout = options.keepalive_timeout;
  service_options.on_keepalive_idle = [cancellation, timeout = options.keepalive_timeout]() {
    observability::record_warning("lifecycle", "keep-alive endpoint idle for " +
                                                   common::format_duration(timeout) +
                                                   ", shutting down");
    cancellation->cancel("keep-alive idle");
  };
  service_options.hooks.on_after_start = [&persister, &options](Service &service) {
    if (persister != nullptr) {
      persister->start();
      std::cerr << "[lifecycle] usage statistics persistence enabled file="
                << persister->file_path() << "\n";
    }
    if (options.on_started) {
      options.on_started(service);
    }
  };

  auto built = Service::build(std::move(service_options), statistics);
  if (!built.ok()) {
    observability::record_error("lifecycle", "failed to build service: " + built.error());
    return common::Status::error("failed to build service: " + built.error());
  }
  auto &service = built.value();

  std::cerr << "[lifecycle] service running host=" << config.gateway.host
            << " port=" << config.gateway.port << "\n";
  const auto run_status = service->run(*cancellation);
  if (!run_status.ok() && !run_status.is_cancelled()) {
    observability::record_error("lifecycle", "service terminated with error: " + run_status.error());
  }
  observability::record_shutdown(cancellation->is_cancelled() ? cancellation->cause()
                                                               : "service returned");

  // A persister that never started has restored nothing; saving it would
  // overwrite the file with an empty snapshot.
  if (persister != nullptr && persister->state() != usage::PersisterState::Idle) {
    persister->stop();
    std::cerr << "[lifecycle] usage statistics persistence "
              << usage::persister_state_to_string(persister->state())
              << " saves=" << persister->completed_saves() << "\n";
  }
  signals.stop();

  if (!run_status.ok() && !run_status.is_cancelled()) {
    return run_status;
  }
  return common::Status::success();
}

} // namespace tallykeep::runtime
