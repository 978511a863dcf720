#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace tallykeep::runtime {

/// One-shot cancellation shared by every shutdown trigger. The first cause
/// wins; later cancel() calls are ignored.
class CancellationSource {
public:
  /// Returns true only for the call that actually cancelled.
  bool cancel(const std::string &cause);

  [[nodiscard]] bool is_cancelled() const;
  [[nodiscard]] std::string cause() const;

  void wait() const;
  /// Returns true if cancelled before the timeout expired.
  [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
  std::string cause_;
};

} // namespace tallykeep::runtime
