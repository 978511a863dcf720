#include "tallykeep/gateway/keepalive.hpp"

namespace tallykeep::gateway {

KeepAliveMonitor::KeepAliveMonitor(const std::chrono::milliseconds timeout,
                                   std::function<void()> on_idle)
    : timeout_(timeout), on_idle_(std::move(on_idle)),
      last_touch_(std::chrono::steady_clock::now()) {}

KeepAliveMonitor::~KeepAliveMonitor() { stop(); }

void KeepAliveMonitor::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable() || stop_requested_) {
    return;
  }
  last_touch_ = std::chrono::steady_clock::now();
  thread_ = std::thread([this]() { watch_loop(); });
}

void KeepAliveMonitor::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    worker = std::move(thread_);
  }
  wake_.notify_all();
  if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
    worker.join();
  } else if (worker.joinable()) {
    worker.detach();
  }
}

void KeepAliveMonitor::touch() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_touch_ = std::chrono::steady_clock::now();
}

bool KeepAliveMonitor::fired() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fired_;
}

void KeepAliveMonitor::watch_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    const auto deadline = last_touch_ + timeout_;
    if (std::chrono::steady_clock::now() >= deadline) {
      fired_ = true;
      lock.unlock();
      if (on_idle_) {
        on_idle_();
      }
      return;
    }
    // touch() only moves the deadline later, so a plain timed wait suffices.
    wake_.wait_until(lock, deadline);
  }
}

} // namespace tallykeep::gateway
