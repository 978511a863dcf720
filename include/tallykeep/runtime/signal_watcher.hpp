#pragma once

#include "tallykeep/common/result.hpp"
#include "tallykeep/runtime/cancellation.hpp"

#include <atomic>
#include <csignal>
#include <memory>
#include <thread>

namespace tallykeep::runtime {

/// Turns SIGINT and SIGTERM into a cancellation.
///
/// start() blocks both signals for the calling thread, so it must run before
/// any other thread is spawned; threads created afterwards inherit the mask
/// and the watcher thread is the only receiver. stop() restores the previous
/// mask and must be called from the same thread as start().
class SignalWatcher {
public:
  explicit SignalWatcher(std::shared_ptr<CancellationSource> cancellation);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const { return running_; }

private:
  void watch_loop();

  std::shared_ptr<CancellationSource> cancellation_;
  sigset_t watched_{};
  sigset_t previous_{};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

[[nodiscard]] const char *signal_name(int signo);

} // namespace tallykeep::runtime
