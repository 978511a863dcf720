#include "tallykeep/usage/file_persister.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/health/health.hpp"
#include "tallykeep/observability/global.hpp"

namespace tallykeep::usage {

namespace {

// Clamps at time_point::max() instead of wrapping into the past.
std::chrono::steady_clock::time_point deadline_after(const std::chrono::steady_clock::time_point from,
                                                     const std::chrono::milliseconds interval) {
  const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::time_point::max() - from);
  if (interval >= headroom) {
    return std::chrono::steady_clock::time_point::max();
  }
  return from + interval;
}

} // namespace

std::string persister_state_to_string(const PersisterState state) {
  switch (state) {
  case PersisterState::Idle:
    return "idle";
  case PersisterState::Running:
    return "running";
  case PersisterState::Stopping:
    return "stopping";
  case PersisterState::Stopped:
    return "stopped";
  }
  return "unknown";
}

FilePersister::FilePersister(FilePersisterOptions options, ISnapshotStore *store)
    : store_(store), interval_(options.interval), restore_on_start_(options.restore_on_start),
      file_path_(common::resolve_home_path(common::trim(options.file_path))) {}

FilePersister::~FilePersister() {
  if (state() == PersisterState::Running) {
    stop();
  }
}

void FilePersister::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != PersisterState::Idle) {
      return;
    }
    state_ = PersisterState::Running;
  }
  health::mark_component_starting(kPersistenceComponent);

  if (restore_on_start_) {
    restore();
  }

  if (interval_ > std::chrono::milliseconds::zero()) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stop_requested_) {
      thread_ = std::thread([this]() { run_loop(); });
    }
  }
  health::mark_component_ok(kPersistenceComponent);
}

void FilePersister::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == PersisterState::Stopping || state_ == PersisterState::Stopped) {
      return;
    }
    state_ = PersisterState::Stopping;
    stop_requested_ = true;
    worker = std::move(thread_);
  }
  wake_.notify_all();
  // An in-flight periodic save finishes before the terminal one starts.
  if (worker.joinable()) {
    worker.join();
  }

  auto status = save();
  if (!status.ok()) {
    observability::record_error("usage", "final save failed: " + status.error());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = PersisterState::Stopped;
  }
  health::mark_component_stopped(kPersistenceComponent);
}

common::Status FilePersister::save() {
  if (store_ == nullptr) {
    return common::Status::success();
  }
  const std::string path = file_path();
  const auto started = std::chrono::steady_clock::now();

  PersistedEnvelope envelope;
  envelope.version = kUsageFileVersion;
  envelope.saved_at = common::now_rfc3339();
  envelope.data = store_->snapshot();

  auto status = save_envelope(path, envelope);
  if (!status.ok()) {
    health::mark_component_error(kPersistenceComponent, status.error());
    return common::Status::error("save " + path + ": " + status.error());
  }

  ++completed_saves_;
  health::mark_component_ok(kPersistenceComponent);
  observability::record_usage_saved(path, envelope.data.total_requests,
                                    envelope.data.total_tokens);
  observability::record_save_duration(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started));
  return common::Status::success();
}

RestoreOutcome FilePersister::load() {
  RestoreOutcome outcome;
  outcome.load = load_envelope(file_path());
  if (outcome.load.status == LoadStatus::Loaded && store_ != nullptr) {
    outcome.merge = store_->merge_snapshot(outcome.load.envelope->data);
  }
  return outcome;
}

PersisterState FilePersister::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string FilePersister::file_path() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_path_;
}

bool FilePersister::has_periodic_task() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return thread_.joinable();
}

void FilePersister::restore() {
  const auto outcome = load();
  const std::string path = file_path();
  switch (outcome.load.status) {
  case LoadStatus::Loaded:
    observability::record_usage_restored(path, outcome.merge.added, outcome.merge.skipped);
    break;
  case LoadStatus::NotFound:
    break;
  case LoadStatus::Corrupt:
    observability::record_warning(
        "usage", "failed to restore from " + path + ": " + outcome.load.error +
                     (outcome.load.quarantined_to.has_value()
                          ? " (moved to " + outcome.load.quarantined_to->string() + ")"
                          : ""));
    break;
  case LoadStatus::UnsupportedVersion:
  case LoadStatus::IoError:
    observability::record_warning("usage",
                                  "failed to restore from " + path + ": " + outcome.load.error);
    break;
  }
}

void FilePersister::run_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  auto next = deadline_after(std::chrono::steady_clock::now(), interval_);
  while (!stop_requested_) {
    if (wake_.wait_until(lock, next, [this]() { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    auto status = save();
    if (!status.ok()) {
      observability::record_error("usage", "periodic save failed: " + status.error());
    }
    lock.lock();

    // Missed ticks are dropped rather than replayed.
    const auto now = std::chrono::steady_clock::now();
    next = deadline_after(next, interval_);
    if (next <= now) {
      next = deadline_after(now, interval_);
    }
  }
}

} // namespace tallykeep::usage
