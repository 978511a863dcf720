#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace tallykeep::gateway {

/// Fires `on_idle` once when touch() has not been called for `timeout`.
class KeepAliveMonitor {
public:
  KeepAliveMonitor(std::chrono::milliseconds timeout, std::function<void()> on_idle);
  ~KeepAliveMonitor();

  KeepAliveMonitor(const KeepAliveMonitor &) = delete;
  KeepAliveMonitor &operator=(const KeepAliveMonitor &) = delete;

  void start();
  void stop();
  void touch();

  [[nodiscard]] bool fired() const;
  [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

private:
  void watch_loop();

  const std::chrono::milliseconds timeout_;
  std::function<void()> on_idle_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::chrono::steady_clock::time_point last_touch_{};
  bool stop_requested_ = false;
  bool fired_ = false;
  std::thread thread_;
};

} // namespace tallykeep::gateway
