#include "tallykeep/runtime/cancellation.hpp"

namespace tallykeep::runtime {

bool CancellationSource::cancel(const std::string &cause) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return false;
    }
    cancelled_ = true;
    cause_ = cause;
  }
  cv_.notify_all();
  return true;
}

bool CancellationSource::is_cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

std::string CancellationSource::cause() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cause_;
}

void CancellationSource::wait() const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return cancelled_; });
}

bool CancellationSource::wait_for(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

} // namespace tallykeep::runtime
