#pragma once

#include "tallykeep/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tallykeep::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string (handles the standard escapes and \uXXXX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Strictly validate a complete JSON document. Trailing garbage is an error.
[[nodiscard]] Status json_validate(const std::string &json);

/// Parse a flat JSON object into a key→value map. Every value is kept as its
/// raw JSON token, strings included with their quotes, so the kind of each
/// value survives. Use the json_to_* readers below to interpret them.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// True for a missing (empty) entry or the `null` literal.
[[nodiscard]] bool json_is_null(const std::string &raw);

/// Read a string token; nullopt unless `raw` is a quoted JSON string.
[[nodiscard]] std::optional<std::string> json_to_string(const std::string &raw);

/// Read a `true`/`false` literal.
[[nodiscard]] std::optional<bool> json_to_bool(const std::string &raw);

/// Read an integral number token. Quoted numbers are rejected.
[[nodiscard]] std::optional<std::int64_t> json_to_int(const std::string &raw);

} // namespace tallykeep::common
