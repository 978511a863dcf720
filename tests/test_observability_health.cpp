#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tallykeep/health/health.hpp"
#include "tallykeep/observability/factory.hpp"
#include "tallykeep/observability/global.hpp"
#include "tallykeep/observability/log_observer.hpp"
#include "tallykeep/observability/multi_observer.hpp"
#include "tallykeep/observability/noop_observer.hpp"
#include "tallykeep/usage/file_persister.hpp"

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

namespace {

namespace obs = tallykeep::observability;

struct Recorded {
  std::mutex mutex;
  std::vector<obs::ObserverEvent> events;
  std::vector<obs::ObserverMetric> metrics;
  int flushes = 0;
};

class RecordingObserver final : public obs::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<Recorded> sink) : sink_(std::move(sink)) {}

  void record_event(const obs::ObserverEvent &event) override {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    sink_->events.push_back(event);
  }
  void record_metric(const obs::ObserverMetric &metric) override {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    sink_->metrics.push_back(metric);
  }
  void flush() override {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    ++sink_->flushes;
  }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<Recorded> sink_;
};

class GlobalObserverGuard {
public:
  explicit GlobalObserverGuard(std::unique_ptr<obs::IObserver> observer) {
    obs::set_global_observer(std::move(observer));
  }
  ~GlobalObserverGuard() { obs::set_global_observer(nullptr); }
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_observability_health_tests(std::vector<tallykeep::tests::TestCase> &tests) {
  using tallykeep::tests::require;
  namespace th = tallykeep::testing;
  namespace health = tallykeep::health;
  namespace usage = tallykeep::usage;

  tests.push_back({"observability_helpers_without_observer_are_noops", [] {
                     obs::set_global_observer(nullptr);
                     require(obs::get_global_observer() == nullptr, "no observer expected");
                     obs::record_warning("test", "dropped");
                     obs::record_tokens_used(5);
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     auto config = th::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log, log";
                     require(obs::create_observer(config)->name() == "multi",
                             "several backends fan out");
                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log",
                             "names are case-insensitive");
                   }});

  tests.push_back({"observability_multi_observer_fans_out", [] {
                     auto first = std::make_shared<Recorded>();
                     auto second = std::make_shared<Recorded>();
                     obs::MultiObserver multi;
                     multi.add(std::make_unique<RecordingObserver>(first));
                     multi.add(std::make_unique<RecordingObserver>(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null children are ignored");

                     multi.record_event(obs::ShutdownEvent{.cause = "test"});
                     multi.record_metric(obs::TokensUsedMetric{.tokens = 3});
                     multi.flush();
                     require(first->events.size() == 1 && second->events.size() == 1,
                             "both children see the event");
                     require(first->metrics.size() == 1 && second->metrics.size() == 1,
                             "both children see the metric");
                     require(first->flushes == 1 && second->flushes == 1, "flush fans out");
                   }});

  tests.push_back({"observability_log_observer_formats_lines", [] {
                     std::ostringstream out;
                     obs::LogObserver log(out);
                     log.record_event(obs::UsageRestoredEvent{
                         .path = "/tmp/usage.json", .added = 4, .skipped = 1});
                     log.record_event(obs::WarningEvent{.component = "usage", .message = "slow"});
                     log.record_event(obs::ErrorEvent{.component = "lifecycle", .message = "boom"});
                     log.record_metric(obs::SaveDurationMetric{.duration = std::chrono::milliseconds(7)});
                     log.flush();
                     const auto text = out.str();
                     require(contains(text, "[INFO] usage.restored path=/tmp/usage.json added=4 "
                                            "skipped=1"),
                             text);
                     require(contains(text, "[WARN] usage: slow"), text);
                     require(contains(text, "[ERROR] lifecycle: boom"), text);
                     require(contains(text, "metric.save_duration_ms=7"), text);
                   }});

  tests.push_back({"observability_persister_reports_saves", [] {
                     auto sink = std::make_shared<Recorded>();
                     GlobalObserverGuard guard(std::make_unique<RecordingObserver>(sink));
                     th::TempWorkspace ws;
                     usage::UsageStatistics stats;
                     stats.record(th::make_record("openai", "gpt-4o", 2, 3));
                     usage::FilePersister persister(
                         {.file_path = (ws.path() / "usage.json").string()}, &stats);
                     const auto saved = persister.save();
                     require(saved.ok(), saved.error());

                     std::lock_guard<std::mutex> lock(sink->mutex);
                     bool saw_saved = false;
                     for (const auto &event : sink->events) {
                       if (const auto *evt = std::get_if<obs::UsageSavedEvent>(&event)) {
                         saw_saved = evt->total_requests == 1 && evt->total_tokens == 5;
                       }
                     }
                     require(saw_saved, "usage.saved event expected");
                     bool saw_duration = false;
                     for (const auto &metric : sink->metrics) {
                       saw_duration = saw_duration ||
                                      std::holds_alternative<obs::SaveDurationMetric>(metric);
                     }
                     require(saw_duration, "save duration metric expected");
                   }});

  tests.push_back({"health_component_transitions", [] {
                     health::clear();
                     health::mark_component_starting("worker");
                     auto status = health::get_component("worker");
                     require(status.has_value(), "component should exist");
                     require(status->state == health::ComponentState::Starting, "starting");

                     health::mark_component_error("worker", "disk full");
                     health::mark_component_error("worker", "still full");
                     status = health::get_component("worker");
                     require(status->state == health::ComponentState::Error, "error state");
                     require(status->error_count == 2, "errors are counted");
                     require(status->last_error == "still full", "latest error kept");
                     require(health::snapshot().overall() == "degraded", "error degrades");

                     health::mark_component_ok("worker");
                     status = health::get_component("worker");
                     require(status->state == health::ComponentState::Ok, "ok state");
                     require(!status->last_error.has_value(), "ok clears last error");
                     require(status->last_ok.has_value(), "ok timestamp recorded");
                     require(health::snapshot().overall() == "ok", "ok overall");

                     health::mark_component_stopped("worker");
                     require(health::get_component("worker")->state ==
                                 health::ComponentState::Stopped,
                             "stopped state");
                     require(health::snapshot().overall() == "ok", "stopped is not degraded");
                     health::clear();
                     require(!health::get_component("worker").has_value(), "clear resets");
                   }});

  tests.push_back({"health_snapshot_json_lists_components", [] {
                     health::clear();
                     health::mark_component_ok("gateway");
                     health::mark_component_error("usage_persistence", "save \"x\" failed");
                     const auto json = health::snapshot_json();
                     require(contains(json, "\"status\":\"degraded\""), json);
                     require(contains(json, "\"gateway\":{\"status\":\"ok\""), json);
                     require(contains(json, "\"error_count\":1"), json);
                     require(contains(json, "save \\\"x\\\" failed"), "errors are escaped");
                     health::clear();
                   }});
}
