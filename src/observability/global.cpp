#include "tallykeep/observability/global.hpp"

#include <mutex>

namespace tallykeep::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_usage_saved(const std::string &path, const std::int64_t total_requests,
                        const std::int64_t total_tokens) {
  record_event(UsageSavedEvent{
      .path = path, .total_requests = total_requests, .total_tokens = total_tokens});
}

void record_usage_restored(const std::string &path, const std::int64_t added,
                           const std::int64_t skipped) {
  record_event(UsageRestoredEvent{.path = path, .added = added, .skipped = skipped});
}

void record_shutdown(const std::string &cause) { record_event(ShutdownEvent{.cause = cause}); }

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_save_duration(std::chrono::milliseconds duration) {
  record_metric(SaveDurationMetric{.duration = duration});
}

void record_tokens_used(const std::uint64_t tokens) {
  record_metric(TokensUsedMetric{.tokens = tokens});
}

} // namespace tallykeep::observability
