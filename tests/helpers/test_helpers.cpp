#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <sys/stat.h>
#include <thread>

namespace tallykeep::testing {

config::Config mock_config() {
  config::Config config;
  config.gateway.host = "127.0.0.1";
  config.gateway.port = 0;
  config.observability.backend = "none";
  config.usage_statistics.save_interval = "0";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("tallykeep-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

EnvGuard::EnvGuard(std::string key, std::optional<std::string> value) : key_(std::move(key)) {
  if (const char *existing = std::getenv(key_.c_str()); existing != nullptr) {
    old_value_ = existing;
  }
  if (value.has_value()) {
    setenv(key_.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key_.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value_.has_value()) {
    setenv(key_.c_str(), old_value_->c_str(), 1);
  } else {
    unsetenv(key_.c_str());
  }
}

usage::UsageRecord make_record(const std::string &api, const std::string &model,
                               const std::int64_t input_tokens, const std::int64_t output_tokens,
                               const bool failed) {
  usage::UsageRecord record;
  record.api = api;
  record.model = model;
  record.source = "test";
  record.auth_index = "0";
  record.tokens.input_tokens = input_tokens;
  record.tokens.output_tokens = output_tokens;
  record.failed = failed;
  return record;
}

usage::StatisticsSnapshot sample_snapshot() {
  usage::UsageStatistics stats;
  auto first = make_record("openai", "gpt-4o", 100, 50);
  first.requested_at = std::chrono::system_clock::from_time_t(1767225600); // 2026-01-01T00:00:00Z
  auto second = make_record("openai", "gpt-4o", 10, 5, true);
  second.requested_at = std::chrono::system_clock::from_time_t(1767229200); // 01:00Z
  auto third = make_record("claude", "sonnet", 7, 3);
  third.requested_at = std::chrono::system_clock::from_time_t(1767315600); // 2026-01-02T01:00Z
  stats.record(first);
  stats.record(second);
  stats.record(third);
  return stats.snapshot();
}

bool wait_until(const std::function<bool()> &condition, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

unsigned file_mode(const std::filesystem::path &path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return 0;
  }
  return static_cast<unsigned>(st.st_mode & 0777);
}

} // namespace tallykeep::testing
