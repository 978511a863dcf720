#include "tallykeep/observability/log_observer.hpp"

#include "tallykeep/common/fs.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace tallykeep::observability {

namespace {

std::mutex g_log_mutex;

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  out << common::now_rfc3339() << " [" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, UsageSavedEvent>) {
          log_line(out_, "DEBUG", "usage.saved path=" + evt.path +
                                      " requests=" + std::to_string(evt.total_requests) +
                                      " tokens=" + std::to_string(evt.total_tokens));
        } else if constexpr (std::is_same_v<T, UsageRestoredEvent>) {
          log_line(out_, "INFO", "usage.restored path=" + evt.path +
                                     " added=" + std::to_string(evt.added) +
                                     " skipped=" + std::to_string(evt.skipped));
        } else if constexpr (std::is_same_v<T, ShutdownEvent>) {
          log_line(out_, "INFO", "shutdown cause=" + evt.cause);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(out_, "WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SaveDurationMetric>) {
          log_line(out_, "DEBUG", "metric.save_duration_ms=" + std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          log_line(out_, "DEBUG", "metric.tokens_used=" + std::to_string(m.tokens));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  out_.flush();
}

} // namespace tallykeep::observability
