#pragma once

#include "tallykeep/common/result.hpp"
#include "tallykeep/usage/statistics.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace tallykeep::usage {

inline constexpr int kUsageFileVersion = 1;

struct PersistedEnvelope {
  int version = kUsageFileVersion;
  std::string saved_at;
  StatisticsSnapshot data;
};

enum class LoadStatus {
  Loaded,
  NotFound,
  Corrupt,
  UnsupportedVersion,
  IoError,
};

[[nodiscard]] std::string load_status_to_string(LoadStatus status);

struct LoadResult {
  LoadStatus status = LoadStatus::NotFound;
  std::optional<PersistedEnvelope> envelope;
  std::string error;
  /// Set when a corrupt file was moved aside.
  std::optional<std::filesystem::path> quarantined_to;

  /// Loaded and NotFound are both normal outcomes.
  [[nodiscard]] bool ok() const {
    return status == LoadStatus::Loaded || status == LoadStatus::NotFound;
  }
};

[[nodiscard]] std::string encode_envelope(const PersistedEnvelope &envelope);

/// Decode envelope bytes without touching the filesystem. Never returns
/// NotFound or IoError.
[[nodiscard]] LoadResult decode_envelope(const std::string &bytes);

[[nodiscard]] std::filesystem::path temp_path_for(const std::filesystem::path &path);
[[nodiscard]] std::filesystem::path quarantine_path_for(const std::filesystem::path &path,
                                                        const std::string &stamp);

/// Write the envelope to `<path>.tmp` (mode 0600) and rename it over `path`.
/// Missing parent directories are created with mode 0700. On failure the
/// temporary file is removed and the previous file at `path` is untouched.
[[nodiscard]] common::Status save_envelope(const std::filesystem::path &path,
                                           const PersistedEnvelope &envelope);

/// Read and decode without side effects. A corrupt file stays where it is.
[[nodiscard]] LoadResult read_envelope(const std::filesystem::path &path);

/// Read and decode for restore. A corrupt file is renamed to
/// `<path>.corrupt.YYYYMMDD-HHMMSS` (local time) so the next save starts fresh.
[[nodiscard]] LoadResult load_envelope(const std::filesystem::path &path);

} // namespace tallykeep::usage
