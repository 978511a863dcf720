#pragma once

#include "tallykeep/observability/observer.hpp"

#include <memory>

namespace tallykeep::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_usage_saved(const std::string &path, std::int64_t total_requests,
                        std::int64_t total_tokens);
void record_usage_restored(const std::string &path, std::int64_t added, std::int64_t skipped);
void record_shutdown(const std::string &cause);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_save_duration(std::chrono::milliseconds duration);
void record_tokens_used(std::uint64_t tokens);

} // namespace tallykeep::observability
