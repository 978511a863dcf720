#include "tallykeep/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <sstream>

namespace tallykeep::common {

namespace {

constexpr std::size_t kMaxJsonDepth = 128;

void append_utf8(std::string &out, std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool read_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  const auto *first = raw.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + 4, out, 16);
  return ec == std::errc() && ptr == first + 4;
}

bool is_hex(const char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; }

// Recursive-descent checker. Positions are advanced in place; any violation
// is reported with its byte offset.
class JsonValidator {
public:
  explicit JsonValidator(const std::string &text) : text_(text) {}

  Status run() {
    pos_ = json_skip_ws(text_, 0);
    if (!value(0)) {
      return fail();
    }
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ != text_.size()) {
      error_ = "unexpected trailing data";
      return fail();
    }
    return Status::success();
  }

private:
  Status fail() const {
    return Status::error(error_ + " at offset " + std::to_string(pos_));
  }

  bool expect(const char ch) {
    if (pos_ < text_.size() && text_[pos_] == ch) {
      ++pos_;
      return true;
    }
    error_ = std::string("expected '") + ch + "'";
    return false;
  }

  bool value(const std::size_t depth) {
    if (depth > kMaxJsonDepth) {
      error_ = "nesting too deep";
      return false;
    }
    if (pos_ >= text_.size()) {
      error_ = "unexpected end of input";
      return false;
    }
    switch (text_[pos_]) {
    case '{':
      return object(depth);
    case '[':
      return array(depth);
    case '"':
      return string();
    case 't':
      return literal("true");
    case 'f':
      return literal("false");
    case 'n':
      return literal("null");
    default:
      return number();
    }
  }

  bool object(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        error_ = "expected object key";
        return false;
      }
      if (!string()) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (!expect(':')) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      return expect('}');
    }
  }

  bool array(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      return expect(']');
    }
  }

  bool string() {
    ++pos_;
    while (pos_ < text_.size()) {
      const auto ch = static_cast<unsigned char>(text_[pos_]);
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (ch < 0x20) {
        error_ = "control character in string";
        return false;
      }
      if (ch == '\\') {
        ++pos_;
        if (pos_ >= text_.size()) {
          break;
        }
        const char esc = text_[pos_];
        if (esc == 'u') {
          for (int i = 1; i <= 4; ++i) {
            if (pos_ + i >= text_.size() || !is_hex(text_[pos_ + i])) {
              error_ = "invalid unicode escape";
              return false;
            }
          }
          pos_ += 4;
        } else if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' &&
                   esc != 'n' && esc != 'r' && esc != 't') {
          error_ = "invalid escape";
          return false;
        }
      }
      ++pos_;
    }
    error_ = "unterminated string";
    return false;
  }

  bool literal(const std::string &word) {
    if (text_.compare(pos_, word.size(), word) != 0) {
      error_ = "invalid literal";
      return false;
    }
    pos_ += word.size();
    return true;
  }

  bool digits() {
    const std::size_t start = pos_;
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
    return pos_ > start;
  }

  bool number() {
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    if (pos_ < text_.size() && text_[pos_] == '0') {
      ++pos_;
    } else if (!digits()) {
      error_ = "invalid value";
      return false;
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (!digits()) {
        error_ = "invalid number";
        return false;
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      if (!digits()) {
        error_ = "invalid number";
        return false;
      }
    }
    return true;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::string error_ = "invalid json";
};

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t code_point = 0;
      if (!read_hex4(raw, i + 1, code_point)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      // A high surrogate followed by an escaped low surrogate is one code point.
      std::uint32_t low = 0;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 2 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u' && read_hex4(raw, i + 3, low) &&
          low >= 0xDC00 && low <= 0xDFFF) {
        code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
        i += 6;
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

Status json_validate(const std::string &json) { return JsonValidator(json).run(); }

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  const std::size_t open = json_skip_ws(json, 0);
  if (open >= json.size() || json[open] != '{') {
    return result;
  }

  std::size_t pos = open + 1;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }

    // expect key
    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = key_end + 1;

    // expect colon
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    ++pos;
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      break;
    }

    // read value
    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, val_end - pos + 1);
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open_ch = json[pos];
      const char close_ch = (open_ch == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open_ch, close_ch);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      // number, true/false/null
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

bool json_is_null(const std::string &raw) { return raw.empty() || raw == "null"; }

std::optional<std::string> json_to_string(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || json_find_string_end(raw, 0) != raw.size() - 1) {
    return std::nullopt;
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::optional<bool> json_to_bool(const std::string &raw) {
  if (raw == "true") {
    return true;
  }
  if (raw == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::int64_t> json_to_int(const std::string &raw) {
  if (raw.empty()) {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace tallykeep::common
