#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tallykeep::observability {

struct UsageSavedEvent {
  std::string path;
  std::int64_t total_requests = 0;
  std::int64_t total_tokens = 0;
};

struct UsageRestoredEvent {
  std::string path;
  std::int64_t added = 0;
  std::int64_t skipped = 0;
};

struct ShutdownEvent {
  std::string cause;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<UsageSavedEvent, UsageRestoredEvent, ShutdownEvent,
                                   WarningEvent, ErrorEvent>;

struct SaveDurationMetric {
  std::chrono::milliseconds duration{0};
};

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

using ObserverMetric = std::variant<SaveDurationMetric, TokensUsedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tallykeep::observability
