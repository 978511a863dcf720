#include "tallykeep/common/toml.hpp"

#include "tallykeep/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace tallykeep::common {

namespace {

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote == '\0' && (ch == '"' || ch == '\'')) {
      quote = ch;
    } else if (quote != '\0' && ch == quote && (quote == '\'' || line[i - 1] != '\\')) {
      quote = '\0';
    }
    if (quote == '\0' && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = value[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  // TOML allows "8_317" style digit grouping.
  std::string digits;
  for (const char ch : trim(it->second)) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (digits.empty() || ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[') {
      if (clean_line.back() != ']') {
        return Result<TomlDocument>::failure("Unterminated section header at line " +
                                             std::to_string(line_number));
      }
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (!document.values.emplace(full_key, value).second) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "' at line " +
                                           std::to_string(line_number));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace tallykeep::common
