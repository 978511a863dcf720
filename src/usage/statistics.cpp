#include "tallykeep/usage/statistics.hpp"

#include "tallykeep/common/fs.hpp"

#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace tallykeep::usage {

namespace {

constexpr const char *kUnknown = "unknown";

std::string normalized_name(const std::string &value) {
  const std::string trimmed = common::trim(value);
  return trimmed.empty() ? kUnknown : trimmed;
}

TokenStats normalize_tokens(TokenStats tokens) {
  if (tokens.total_tokens == 0) {
    tokens.total_tokens = saturating_add(
        saturating_add(tokens.input_tokens, tokens.output_tokens), tokens.reasoning_tokens);
  }
  return tokens;
}

} // namespace

std::int64_t saturating_add(const std::int64_t a, const std::int64_t b) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if (b > 0 && a > kMax - b) {
    return kMax;
  }
  if (b < 0 && a < kMin - b) {
    return kMin;
  }
  return a + b;
}

std::string format_detail_timestamp(const std::chrono::system_clock::time_point when) {
  const auto t = std::chrono::system_clock::to_time_t(when);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() %
      1000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return out.str();
}

void UsageStatistics::record(const UsageRecord &record) {
  if (!enabled_) {
    return;
  }
  RequestDetail detail;
  detail.timestamp = format_detail_timestamp(record.requested_at);
  detail.source = record.source;
  detail.auth_index = record.auth_index;
  detail.tokens = normalize_tokens(record.tokens);
  detail.failed = record.failed;

  const std::string api = normalized_name(record.api);
  const std::string model = normalized_name(record.model);

  std::lock_guard<std::mutex> lock(mutex_);
  seen_.insert(detail_key(api, model, detail));
  apply_locked(api, model, std::move(detail));
}

StatisticsSnapshot UsageStatistics::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

MergeResult UsageStatistics::merge_snapshot(const StatisticsSnapshot &snapshot) {
  MergeResult result;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[api_name, api] : snapshot.apis) {
    const std::string api_key = normalized_name(api_name);
    for (const auto &[model_name, model] : api.models) {
      const std::string model_key = normalized_name(model_name);
      for (const auto &detail : model.details) {
        RequestDetail incoming = detail;
        incoming.tokens = normalize_tokens(incoming.tokens);
        if (!seen_.insert(detail_key(api_key, model_key, incoming)).second) {
          ++result.skipped;
          continue;
        }
        apply_locked(api_key, model_key, std::move(incoming));
        ++result.added;
      }
    }
  }
  return result;
}

void UsageStatistics::set_enabled(const bool enabled) { enabled_ = enabled; }

bool UsageStatistics::enabled() const { return enabled_; }

void UsageStatistics::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = StatisticsSnapshot{};
  seen_.clear();
}

std::string UsageStatistics::detail_key(const std::string &api, const std::string &model,
                                        const RequestDetail &detail) {
  std::ostringstream key;
  key << api << '|' << model << '|' << detail.timestamp << '|' << detail.source << '|'
      << detail.auth_index << '|' << (detail.failed ? 1 : 0) << '|'
      << detail.tokens.input_tokens << '|' << detail.tokens.output_tokens << '|'
      << detail.tokens.reasoning_tokens << '|' << detail.tokens.cached_tokens << '|'
      << detail.tokens.total_tokens;
  return key.str();
}

void UsageStatistics::apply_locked(const std::string &api, const std::string &model,
                                   RequestDetail detail) {
  const std::int64_t tokens = detail.tokens.total_tokens;

  ++state_.total_requests;
  if (detail.failed) {
    ++state_.failure_count;
  } else {
    ++state_.success_count;
  }
  state_.total_tokens = saturating_add(state_.total_tokens, tokens);

  auto &api_stats = state_.apis[api];
  ++api_stats.total_requests;
  api_stats.total_tokens = saturating_add(api_stats.total_tokens, tokens);

  auto &model_stats = api_stats.models[model];
  ++model_stats.total_requests;
  model_stats.total_tokens = saturating_add(model_stats.total_tokens, tokens);

  // "YYYY-MM-DDTHH..." buckets by calendar day and hour of day.
  if (detail.timestamp.size() >= 13 && detail.timestamp[10] == 'T') {
    const std::string day = detail.timestamp.substr(0, 10);
    const std::string hour = detail.timestamp.substr(11, 2);
    ++state_.requests_by_day[day];
    ++state_.requests_by_hour[hour];
    state_.tokens_by_day[day] = saturating_add(state_.tokens_by_day[day], tokens);
    state_.tokens_by_hour[hour] = saturating_add(state_.tokens_by_hour[hour], tokens);
  }

  model_stats.details.push_back(std::move(detail));
}

} // namespace tallykeep::usage
