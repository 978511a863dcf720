#include "tallykeep/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <vector>

namespace tallykeep::common {

namespace {

struct DurationUnit {
  const char *suffix;
  double millis;
};

// Longest duration whose nanosecond count fits in int64 (about 292 years).
constexpr double kMaxDurationMillis =
    static_cast<double>(std::numeric_limits<std::int64_t>::max() / 1'000'000);

// Matching picks the longest suffix, so "ms" is never read as "m".
constexpr DurationUnit kDurationUnits[] = {
    {"ns", 1.0 / 1'000'000.0}, {"us", 1.0 / 1000.0}, {"\xC2\xB5s", 1.0 / 1000.0},
    {"ms", 1.0},               {"s", 1000.0},        {"m", 60'000.0},
    {"h", 3'600'000.0},
};

std::tm to_tm(std::time_t t, bool utc) {
  std::tm tm{};
  if (utc) {
    gmtime_r(&t, &tm);
  } else {
    localtime_r(&t, &tm);
  }
  return tm;
}

} // namespace

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

Result<std::filesystem::path> ensure_private_dir(const std::filesystem::path &path) {
  if (path.empty()) {
    return Result<std::filesystem::path>::success(path);
  }

  std::error_code ec;
  std::vector<std::filesystem::path> missing;
  for (auto current = path; !current.empty(); current = current.parent_path()) {
    if (std::filesystem::exists(current, ec)) {
      break;
    }
    missing.push_back(current);
    if (current == current.parent_path()) {
      break;
    }
  }

  for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
    std::filesystem::create_directory(*it, ec);
    if (ec) {
      return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                    it->string() + ": " + ec.message());
    }
    std::filesystem::permissions(*it, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
      return Result<std::filesystem::path>::failure("Failed to restrict directory: " +
                                                    it->string() + ": " + ec.message());
    }
  }

  if (!std::filesystem::is_directory(path, ec)) {
    return Result<std::filesystem::path>::failure("Not a directory: " + path.string());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string resolve_home_path(const std::string &path) {
  if (!starts_with(path, "~")) {
    return path;
  }
  auto home = home_dir();
  if (!home.ok()) {
    return path;
  }

  std::string remainder = path.substr(1);
  const auto first = remainder.find_first_not_of("/\\");
  remainder = first == std::string::npos ? "" : remainder.substr(first);
  if (remainder.empty()) {
    return home.value().string();
  }
  return (home.value() / remainder).lexically_normal().string();
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  value = resolve_home_path(value);

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::chrono::milliseconds> parse_duration(const std::string &text) {
  using Out = Result<std::chrono::milliseconds>;
  const std::string input = trim(text);
  if (input.empty()) {
    return Out::failure("empty duration");
  }

  std::size_t pos = 0;
  double sign = 1.0;
  if (input[pos] == '-' || input[pos] == '+') {
    sign = input[pos] == '-' ? -1.0 : 1.0;
    ++pos;
  }
  if (input.substr(pos) == "0") {
    return Out::success(std::chrono::milliseconds(0));
  }
  if (pos >= input.size()) {
    return Out::failure("invalid duration: " + input);
  }

  double total = 0.0;
  while (pos < input.size()) {
    const std::size_t number_start = pos;
    bool seen_digit = false;
    bool seen_dot = false;
    while (pos < input.size() &&
           (std::isdigit(static_cast<unsigned char>(input[pos])) != 0 ||
            (input[pos] == '.' && !seen_dot))) {
      if (input[pos] == '.') {
        seen_dot = true;
      } else {
        seen_digit = true;
      }
      ++pos;
    }
    if (!seen_digit) {
      return Out::failure("invalid duration: " + input);
    }
    const double amount =
        std::strtod(input.substr(number_start, pos - number_start).c_str(), nullptr);

    const DurationUnit *unit = nullptr;
    for (const auto &candidate : kDurationUnits) {
      if (input.compare(pos, std::char_traits<char>::length(candidate.suffix), candidate.suffix) ==
          0) {
        if (unit == nullptr ||
            std::char_traits<char>::length(candidate.suffix) >
                std::char_traits<char>::length(unit->suffix)) {
          unit = &candidate;
        }
      }
    }
    if (unit == nullptr) {
      return Out::failure("missing unit in duration: " + input);
    }
    pos += std::char_traits<char>::length(unit->suffix);
    total += amount * unit->millis;
    if (!(total <= kMaxDurationMillis)) {
      return Out::failure("duration out of range: " + input);
    }
  }

  return Out::success(std::chrono::milliseconds(static_cast<long long>(sign * total)));
}

std::string format_duration(const std::chrono::milliseconds duration) {
  long long ms = duration.count();
  if (ms == 0) {
    return "0s";
  }
  std::ostringstream out;
  if (ms < 0) {
    out << '-';
    ms = -ms;
  }
  if (ms < 1000) {
    out << ms << "ms";
    return out.str();
  }
  const long long hours = ms / 3'600'000;
  const long long minutes = (ms / 60'000) % 60;
  const long long seconds = (ms / 1000) % 60;
  const long long millis = ms % 1000;
  if (hours > 0) {
    out << hours << 'h';
  }
  if (hours > 0 || minutes > 0) {
    out << minutes << 'm';
  }
  out << seconds;
  if (millis > 0) {
    std::ostringstream frac;
    frac << std::setw(3) << std::setfill('0') << millis;
    std::string digits = frac.str();
    digits.erase(digits.find_last_not_of('0') + 1);
    out << '.' << digits;
  }
  out << 's';
  return out.str();
}

std::string format_rfc3339(const std::chrono::system_clock::time_point when) {
  const auto tm = to_tm(std::chrono::system_clock::to_time_t(when), true);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

std::string local_timestamp_compact() {
  const auto tm = to_tm(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()),
                        false);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%d-%H%M%S");
  return out.str();
}

} // namespace tallykeep::common
