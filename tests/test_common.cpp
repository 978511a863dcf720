#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/common/json_util.hpp"
#include "tallykeep/common/toml.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

void register_common_tests(std::vector<tallykeep::tests::TestCase> &tests) {
  using tallykeep::tests::require;
  namespace common = tallykeep::common;
  namespace th = tallykeep::testing;

  tests.push_back({"resolve_home_path_expands_tilde_prefix", [] {
                     const th::EnvGuard home("HOME", "/home/tester");
                     require(common::resolve_home_path("~/stats.json") == "/home/tester/stats.json",
                             "tilde slash should join onto home");
                     require(common::resolve_home_path("~") == "/home/tester",
                             "bare tilde should be the home directory");
                     require(common::resolve_home_path("~//nested/x.json") ==
                                 "/home/tester/nested/x.json",
                             "repeated separators after tilde should be trimmed");
                   }});

  tests.push_back({"resolve_home_path_leaves_other_paths_alone", [] {
                     const th::EnvGuard home("HOME", "/home/tester");
                     require(common::resolve_home_path("/var/lib/x.json") == "/var/lib/x.json",
                             "absolute path should pass through");
                     require(common::resolve_home_path("relative/x.json") == "relative/x.json",
                             "relative path should pass through");
                     require(common::resolve_home_path("") == "", "empty path should pass through");
                   }});

  tests.push_back({"resolve_home_path_without_home_returns_input", [] {
                     const th::EnvGuard home("HOME", std::nullopt);
                     require(common::resolve_home_path("~/stats.json") == "~/stats.json",
                             "unresolvable home should return the original string");
                   }});

  tests.push_back({"parse_duration_accepts_compound_units", [] {
                     using std::chrono::milliseconds;
                     auto check = [](const std::string &text, long long expected) {
                       const auto parsed = common::parse_duration(text);
                       require(parsed.ok(), "should parse " + text + ": " + parsed.error());
                       require(parsed.value() == milliseconds(expected),
                               text + " parsed to " + std::to_string(parsed.value().count()));
                     };
                     check("90s", 90'000);
                     check("5m", 300'000);
                     check("1h30m", 5'400'000);
                     check("250ms", 250);
                     check("1.5s", 1500);
                     check("0", 0);
                     check("-2s", -2000);
                   }});

  tests.push_back({"parse_duration_rejects_garbage", [] {
                     require(!common::parse_duration("").ok(), "empty should fail");
                     require(!common::parse_duration("abc").ok(), "letters should fail");
                     require(!common::parse_duration("10").ok(), "missing unit should fail");
                     require(!common::parse_duration("5x").ok(), "unknown unit should fail");
                     require(!common::parse_duration("3000000h").ok(), "overflow should fail");
                     require(!common::parse_duration(std::string(400, '9') + "h").ok(),
                             "huge digit runs should fail");
                   }});

  tests.push_back({"format_duration_is_compact", [] {
                     using std::chrono::milliseconds;
                     require(common::format_duration(milliseconds(10'000)) == "10s",
                             "10 seconds should render as 10s");
                     require(common::format_duration(milliseconds(0)) == "0s", "zero renders 0s");
                     require(common::format_duration(milliseconds(250)) == "250ms",
                             "sub-second renders in ms");
                   }});

  tests.push_back({"local_timestamp_compact_shape", [] {
                     const auto stamp = common::local_timestamp_compact();
                     require(stamp.size() == 15, "expected YYYYMMDD-HHMMSS, got " + stamp);
                     require(stamp[8] == '-', "separator should be at index 8");
                   }});

  tests.push_back({"ensure_private_dir_creates_owner_only_dirs", [] {
                     th::TempWorkspace ws;
                     const auto target = ws.path() / "a" / "b";
                     const auto created = common::ensure_private_dir(target);
                     require(created.ok(), created.error());
                     require(std::filesystem::is_directory(target), "directory should exist");
                     require(th::file_mode(ws.path() / "a") == 0700, "intermediate dir should be 0700");
                     require(th::file_mode(target) == 0700, "leaf dir should be 0700");
                   }});

  tests.push_back({"json_validate_accepts_documents", [] {
                     require(common::json_validate(R"({"a":[1,2.5,-3e2],"b":{"c":null}})").ok(),
                             "nested document should validate");
                     require(common::json_validate(" true ").ok(), "literal should validate");
                     require(common::json_validate(R"("é")").ok(), "unicode escape ok");
                   }});

  tests.push_back({"json_validate_rejects_malformed", [] {
                     require(!common::json_validate("").ok(), "empty should fail");
                     require(!common::json_validate("{").ok(), "truncated should fail");
                     require(!common::json_validate(R"({"a":1,})").ok(), "trailing comma fails");
                     require(!common::json_validate(R"({"a":1} x)").ok(), "trailing garbage fails");
                     require(!common::json_validate("{'a':1}").ok(), "single quotes fail");
                     require(!common::json_validate("not json at all").ok(), "text fails");
                   }});

  tests.push_back({"json_parse_flat_keeps_nested_raw", [] {
                     const auto map = common::json_parse_flat(
                         R"({"name":"a\"b","n":42,"obj":{"x":[1]},"flag":false})");
                     require(map.at("name") == R"("a\"b")", "string should stay quoted");
                     require(common::json_to_string(map.at("name")) == std::optional<std::string>("a\"b"),
                             "string should unescape on read");
                     require(map.at("n") == "42", "number should be raw");
                     require(map.at("obj") == R"({"x":[1]})", "object should be raw");
                     require(map.at("flag") == "false", "literal should be raw");
                   }});

  tests.push_back({"json_flat_values_keep_their_kind", [] {
                     const auto map = common::json_parse_flat(
                         R"({"s":"null","n":null,"q":"12","i":12,"b":"true","t":true})");
                     require(common::json_to_string(map.at("s")) == std::optional<std::string>("null"),
                             "string null is a string");
                     require(common::json_is_null(map.at("n")), "literal null is null");
                     require(!common::json_is_null(map.at("s")), "string null is not null");
                     require(!common::json_to_int(map.at("q")).has_value(), "quoted number is no int");
                     require(common::json_to_int(map.at("i")) == std::optional<std::int64_t>(12),
                             "bare number is an int");
                     require(!common::json_to_bool(map.at("b")).has_value(), "quoted bool is no bool");
                     require(common::json_to_bool(map.at("t")) == std::optional<bool>(true),
                             "literal true is a bool");
                     require(!common::json_to_string(map.at("i")).has_value(), "number is no string");
                   }});

  tests.push_back({"json_unescape_joins_surrogate_pairs", [] {
                     require(common::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "surrogate pair should become one 4-byte code point");
                     require(common::json_unescape("\\u00e9") == "\xC3\xA9", "two-byte escape");
                     require(common::json_unescape("\\u20ac") == "\xE2\x82\xAC", "three-byte escape");
                   }});

  tests.push_back({"json_escape_round_trips_control_chars", [] {
                     const std::string raw = "line\nbreak\t\"quoted\"\x01";
                     const auto quoted = common::json_quote(raw);
                     require(common::json_validate(quoted).ok(), "quoted string must be valid json");
                     require(common::json_unescape(quoted.substr(1, quoted.size() - 2)) == raw,
                             "unescape should restore the original");
                   }});

  tests.push_back({"json_to_int_is_strict", [] {
                     require(common::json_to_int("42") == std::optional<std::int64_t>(42), "42");
                     require(common::json_to_int("-7") == std::optional<std::int64_t>(-7), "-7");
                     require(!common::json_to_int("4.2").has_value(), "fraction should fail");
                     require(!common::json_to_int("\"1\"x").has_value(), "garbage should fail");
                     require(!common::json_to_int("").has_value(), "empty should fail");
                   }});

  tests.push_back({"toml_parses_sections_and_types", [] {
                     const auto doc = common::parse_toml(R"(
# comment
[usage_statistics]
persist_file = "~/x.json" # trailing
save_interval = '90s'
restore_on_start = false

[gateway]
port = 8_317
)");
                     require(doc.ok(), doc.error());
                     const auto &d = doc.value();
                     require(d.get_string("usage_statistics.persist_file") == "~/x.json",
                             "string value mismatch");
                     require(d.get_string("usage_statistics.save_interval") == "90s",
                             "literal string mismatch");
                     require(!d.get_bool("usage_statistics.restore_on_start", true),
                             "bool value mismatch");
                     require(d.get_u64("gateway.port", 0) == 8317, "grouped integer mismatch");
                   }});

  tests.push_back({"toml_rejects_duplicates_and_bad_headers", [] {
                     require(!common::parse_toml("[a]\nx = 1\nx = 2\n").ok(),
                             "duplicate key should fail");
                     require(!common::parse_toml("[a\nx = 1\n").ok(), "bad header should fail");
                     require(!common::parse_toml("just text\n").ok(), "missing = should fail");
                   }});
}
