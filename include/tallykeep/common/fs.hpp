#pragma once

#include "tallykeep/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace tallykeep::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] Result<std::filesystem::path>
ensure_private_dir(const std::filesystem::path &path);

/// Expand a leading "~" to the home directory. Returns the input unchanged when
/// the home directory cannot be determined.
[[nodiscard]] std::string resolve_home_path(const std::string &path);

/// Expand "~" and $VAR / ${VAR} references.
[[nodiscard]] std::string expand_path(std::string value);

/// Parse a duration such as "90s", "1h30m", "250ms" or "0".
[[nodiscard]] Result<std::chrono::milliseconds> parse_duration(const std::string &text);
[[nodiscard]] std::string format_duration(std::chrono::milliseconds duration);

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string local_timestamp_compact();

} // namespace tallykeep::common
