#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace tallykeep::usage {

struct TokenStats {
  std::int64_t input_tokens = 0;
  std::int64_t output_tokens = 0;
  std::int64_t reasoning_tokens = 0;
  std::int64_t cached_tokens = 0;
  std::int64_t total_tokens = 0;

  bool operator==(const TokenStats &) const = default;
};

struct RequestDetail {
  std::string timestamp; // RFC3339, UTC
  std::string source;
  std::string auth_index;
  TokenStats tokens;
  bool failed = false;

  bool operator==(const RequestDetail &) const = default;
};

struct ModelSnapshot {
  std::int64_t total_requests = 0;
  std::int64_t total_tokens = 0;
  std::vector<RequestDetail> details;

  bool operator==(const ModelSnapshot &) const = default;
};

struct ApiSnapshot {
  std::int64_t total_requests = 0;
  std::int64_t total_tokens = 0;
  std::map<std::string, ModelSnapshot> models;

  bool operator==(const ApiSnapshot &) const = default;
};

struct StatisticsSnapshot {
  std::int64_t total_requests = 0;
  std::int64_t success_count = 0;
  std::int64_t failure_count = 0;
  std::int64_t total_tokens = 0;
  std::map<std::string, ApiSnapshot> apis;
  std::map<std::string, std::int64_t> requests_by_day;
  std::map<std::string, std::int64_t> requests_by_hour;
  std::map<std::string, std::int64_t> tokens_by_day;
  std::map<std::string, std::int64_t> tokens_by_hour;

  bool operator==(const StatisticsSnapshot &) const = default;
};

struct MergeResult {
  std::int64_t added = 0;
  std::int64_t skipped = 0;
};

struct UsageRecord {
  std::string api;
  std::string model;
  std::string source;
  std::string auth_index;
  std::chrono::system_clock::time_point requested_at = std::chrono::system_clock::now();
  TokenStats tokens;
  bool failed = false;
};

/// The two capabilities persistence needs from a statistics store. Both must
/// be safe to call concurrently with request recording.
class ISnapshotStore {
public:
  virtual ~ISnapshotStore() = default;

  [[nodiscard]] virtual StatisticsSnapshot snapshot() const = 0;
  virtual MergeResult merge_snapshot(const StatisticsSnapshot &snapshot) = 0;
};

/// In-memory request counters, aggregated per API key and model.
///
/// merge_snapshot() never counts a detail twice: every detail is identified by
/// api, model, timestamp, source, auth index, failure flag and token counts,
/// and a detail whose identity is already present is skipped.
class UsageStatistics final : public ISnapshotStore {
public:
  void record(const UsageRecord &record);

  [[nodiscard]] StatisticsSnapshot snapshot() const override;
  MergeResult merge_snapshot(const StatisticsSnapshot &snapshot) override;

  void set_enabled(bool enabled);
  [[nodiscard]] bool enabled() const;
  void clear();

private:
  [[nodiscard]] static std::string detail_key(const std::string &api, const std::string &model,
                                              const RequestDetail &detail);
  void apply_locked(const std::string &api, const std::string &model, RequestDetail detail);

  mutable std::mutex mutex_;
  StatisticsSnapshot state_;
  std::unordered_set<std::string> seen_;
  std::atomic<bool> enabled_{true};
};

[[nodiscard]] std::string format_detail_timestamp(std::chrono::system_clock::time_point when);

/// Token sums clamp at the int64 limits instead of wrapping.
[[nodiscard]] std::int64_t saturating_add(std::int64_t a, std::int64_t b);

} // namespace tallykeep::usage
