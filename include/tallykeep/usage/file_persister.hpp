#pragma once

#include "tallykeep/common/result.hpp"
#include "tallykeep/usage/file_store.hpp"
#include "tallykeep/usage/statistics.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace tallykeep::usage {

inline constexpr const char *kPersistenceComponent = "usage_persistence";

enum class PersisterState { Idle, Running, Stopping, Stopped };

[[nodiscard]] std::string persister_state_to_string(PersisterState state);

struct FilePersisterOptions {
  std::string file_path; // "~" is expanded on construction
  std::chrono::milliseconds interval{0};
  bool restore_on_start = false;
};

struct RestoreOutcome {
  LoadResult load;
  MergeResult merge;
};

/// Keeps a snapshot store mirrored in a JSON file: optional restore on start,
/// periodic saves while running, and one terminal save on stop.
class FilePersister {
public:
  /// `store` may be null, in which case save() does nothing.
  FilePersister(FilePersisterOptions options, ISnapshotStore *store);
  ~FilePersister();

  FilePersister(const FilePersister &) = delete;
  FilePersister &operator=(const FilePersister &) = delete;

  void start();
  /// Idempotent; only the first call performs the terminal save.
  void stop();

  [[nodiscard]] common::Status save();
  [[nodiscard]] RestoreOutcome load();

  [[nodiscard]] PersisterState state() const;
  [[nodiscard]] std::string file_path() const;
  [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }
  [[nodiscard]] bool has_periodic_task() const;
  [[nodiscard]] std::size_t completed_saves() const { return completed_saves_; }

private:
  void run_loop();
  void restore();

  ISnapshotStore *store_;
  const std::chrono::milliseconds interval_;
  const bool restore_on_start_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::string file_path_;
  PersisterState state_ = PersisterState::Idle;
  bool stop_requested_ = false;
  std::thread thread_;
  std::atomic<std::size_t> completed_saves_{0};
};

} // namespace tallykeep::usage
