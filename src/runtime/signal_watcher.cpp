#include "tallykeep/runtime/signal_watcher.hpp"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <string>
#include <time.h>

namespace tallykeep::runtime {

namespace {

constexpr long kPollNanos = 100L * 1000L * 1000L;

} // namespace

const char *signal_name(const int signo) {
  switch (signo) {
  case SIGINT:
    return "SIGINT";
  case SIGTERM:
    return "SIGTERM";
  default:
    return "unknown";
  }
}

SignalWatcher::SignalWatcher(std::shared_ptr<CancellationSource> cancellation)
    : cancellation_(std::move(cancellation)) {
  sigemptyset(&watched_);
  sigaddset(&watched_, SIGINT);
  sigaddset(&watched_, SIGTERM);
}

SignalWatcher::~SignalWatcher() { stop(); }

common::Status SignalWatcher::start() {
  if (running_) {
    return common::Status::success();
  }
  const int rc = pthread_sigmask(SIG_BLOCK, &watched_, &previous_);
  if (rc != 0) {
    return common::Status::error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
  }
  running_ = true;
  thread_ = std::thread([this]() { watch_loop(); });
  return common::Status::success();
}

void SignalWatcher::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

void SignalWatcher::watch_loop() {
  const timespec timeout{0, kPollNanos};
  while (running_) {
    siginfo_t info{};
    const int signo = sigtimedwait(&watched_, &info, &timeout);
    if (signo < 0) {
      // EAGAIN on timeout, EINTR on an unrelated signal.
      continue;
    }
    if (cancellation_ != nullptr) {
      cancellation_->cancel(std::string("signal ") + signal_name(signo));
    }
  }
}

} // namespace tallykeep::runtime
