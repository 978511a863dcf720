#pragma once

#include "tallykeep/observability/observer.hpp"

#include <memory>
#include <vector>

namespace tallykeep::observability {

// Fans every event and metric out to each child observer in insertion order.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer) {
    if (observer != nullptr) {
      observers_.push_back(std::move(observer));
    }
  }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override {
    for (auto &observer : observers_) {
      observer->record_event(event);
    }
  }
  void record_metric(const ObserverMetric &metric) override {
    for (auto &observer : observers_) {
      observer->record_metric(metric);
    }
  }
  void flush() override {
    for (auto &observer : observers_) {
      observer->flush();
    }
  }
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace tallykeep::observability
