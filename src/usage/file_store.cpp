#include "tallykeep/usage/file_store.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/common/json_util.hpp"
#include "tallykeep/usage/snapshot_json.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace tallykeep::usage {

namespace {

constexpr mode_t kFileMode = 0600;

LoadResult make_result(const LoadStatus status, std::string error) {
  LoadResult result;
  result.status = status;
  result.error = std::move(error);
  return result;
}

common::Status write_all(const int fd, const std::string &bytes) {
  std::size_t written = 0;
  while (written < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return common::Status::error(std::strerror(errno));
    }
    written += static_cast<std::size_t>(n);
  }
  return common::Status::success();
}

common::Status write_private_file(const std::filesystem::path &path, const std::string &bytes) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, kFileMode);
  if (fd < 0) {
    return common::Status::error("open " + path.string() + ": " + std::strerror(errno));
  }
  // A leftover temp file keeps its old mode across O_TRUNC.
  if (::fchmod(fd, kFileMode) != 0) {
    const std::string error = std::strerror(errno);
    ::close(fd);
    return common::Status::error("chmod " + path.string() + ": " + error);
  }
  auto status = write_all(fd, bytes);
  if (status.ok() && ::fsync(fd) != 0) {
    status = common::Status::error(std::strerror(errno));
  }
  if (::close(fd) != 0 && status.ok()) {
    status = common::Status::error(std::strerror(errno));
  }
  if (!status.ok()) {
    return common::Status::error("write " + path.string() + ": " + status.error());
  }
  return common::Status::success();
}

enum class ReadOutcome { Ok, Missing, Failed };

ReadOutcome read_file(const std::filesystem::path &path, std::string &out, std::string &error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      error = "stat " + path.string() + ": " + ec.message();
      return ReadOutcome::Failed;
    }
    return ReadOutcome::Missing;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "open " + path.string() + ": " + std::strerror(errno);
    return ReadOutcome::Failed;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    error = "read " + path.string() + " failed";
    return ReadOutcome::Failed;
  }
  out = buffer.str();
  return ReadOutcome::Ok;
}

} // namespace

std::string load_status_to_string(const LoadStatus status) {
  switch (status) {
  case LoadStatus::Loaded:
    return "loaded";
  case LoadStatus::NotFound:
    return "not_found";
  case LoadStatus::Corrupt:
    return "corrupt";
  case LoadStatus::UnsupportedVersion:
    return "unsupported_version";
  case LoadStatus::IoError:
    return "io_error";
  }
  return "unknown";
}

std::string encode_envelope(const PersistedEnvelope &envelope) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"version\": " << envelope.version << ",\n";
  out << "  \"saved_at\": " << common::json_quote(envelope.saved_at) << ",\n";
  out << "  \"data\": " << snapshot_to_json(envelope.data, 1) << "\n";
  out << "}\n";
  return out.str();
}

LoadResult decode_envelope(const std::string &bytes) {
  auto valid = common::json_validate(bytes);
  if (!valid.ok()) {
    return make_result(LoadStatus::Corrupt, "invalid json: " + valid.error());
  }
  const std::size_t start = common::json_skip_ws(bytes, 0);
  if (bytes[start] != '{') {
    return make_result(LoadStatus::Corrupt, "envelope is not a json object");
  }

  const auto fields = common::json_parse_flat(bytes);
  PersistedEnvelope envelope;
  std::int64_t version = 0;
  if (const auto it = fields.find("version");
      it != fields.end() && !common::json_is_null(it->second)) {
    const auto parsed = common::json_to_int(it->second);
    if (!parsed.has_value()) {
      return make_result(LoadStatus::Corrupt, "envelope version is not an integer");
    }
    version = *parsed;
  }
  if (const auto it = fields.find("saved_at");
      it != fields.end() && !common::json_is_null(it->second)) {
    auto saved_at = common::json_to_string(it->second);
    if (!saved_at.has_value()) {
      return make_result(LoadStatus::Corrupt, "envelope saved_at is not a string");
    }
    envelope.saved_at = std::move(*saved_at);
  }

  if (const auto it = fields.find("data"); it != fields.end()) {
    auto data = snapshot_from_json(it->second);
    if (!data.ok()) {
      return make_result(LoadStatus::Corrupt, "invalid data: " + data.error());
    }
    envelope.data = std::move(data.value());
  }

  // Compared at full width so an out-of-range version cannot narrow to 1.
  if (version != kUsageFileVersion) {
    return make_result(LoadStatus::UnsupportedVersion,
                       "unsupported version " + std::to_string(version));
  }
  envelope.version = kUsageFileVersion;

  LoadResult result;
  result.status = LoadStatus::Loaded;
  result.envelope = std::move(envelope);
  return result;
}

std::filesystem::path temp_path_for(const std::filesystem::path &path) {
  return std::filesystem::path(path.string() + ".tmp");
}

std::filesystem::path quarantine_path_for(const std::filesystem::path &path,
                                          const std::string &stamp) {
  return std::filesystem::path(path.string() + ".corrupt." + stamp);
}

common::Status save_envelope(const std::filesystem::path &path,
                             const PersistedEnvelope &envelope) {
  if (path.empty()) {
    return common::Status::error("usage file path is empty");
  }
  if (path.has_parent_path()) {
    auto dir = common::ensure_private_dir(path.parent_path());
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
  }

  const auto tmp = temp_path_for(path);
  auto written = write_private_file(tmp, encode_envelope(envelope));
  if (!written.ok()) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return written;
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return common::Status::error("rename " + tmp.string() + " -> " + path.string() + ": " +
                                 ec.message());
  }
  return common::Status::success();
}

LoadResult read_envelope(const std::filesystem::path &path) {
  std::string bytes;
  std::string error;
  switch (read_file(path, bytes, error)) {
  case ReadOutcome::Missing:
    return make_result(LoadStatus::NotFound, "");
  case ReadOutcome::Failed:
    return make_result(LoadStatus::IoError, error);
  case ReadOutcome::Ok:
    break;
  }
  return decode_envelope(bytes);
}

LoadResult load_envelope(const std::filesystem::path &path) {
  auto result = read_envelope(path);
  if (result.status != LoadStatus::Corrupt) {
    return result;
  }

  const auto target = quarantine_path_for(path, common::local_timestamp_compact());
  std::error_code ec;
  std::filesystem::rename(path, target, ec);
  if (ec) {
    result.error += "; quarantine to " + target.string() + " failed: " + ec.message();
    return result;
  }
  result.quarantined_to = target;
  return result;
}

} // namespace tallykeep::usage
