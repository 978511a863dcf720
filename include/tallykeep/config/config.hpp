#pragma once

#include "tallykeep/common/result.hpp"
#include "tallykeep/config/schema.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tallykeep::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Status save_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

struct SaveInterval {
  std::chrono::milliseconds interval{0};
  // Set when the configured value was rejected and periodic saving is off.
  std::optional<std::string> warning;
};

/// Interpret usage_statistics.save_interval. Empty, "0", unparsable and
/// non-positive values all yield a zero interval.
[[nodiscard]] SaveInterval parse_save_interval(const std::string &raw);

} // namespace tallykeep::config
