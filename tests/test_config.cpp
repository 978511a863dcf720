#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/config/config.hpp"

#include <filesystem>
#include <fstream>

namespace {

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = tallykeep::config::config_path_override();
    if (next.has_value()) {
      tallykeep::config::set_config_path_override(*next);
    } else {
      tallykeep::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      tallykeep::config::set_config_path_override(*old_override);
    } else {
      tallykeep::config::clear_config_path_override();
    }
  }
};

// Clears every variable that apply_env_overrides() reads.
struct CleanEnv {
  tallykeep::testing::EnvGuard config_path{"TALLYKEEP_CONFIG_PATH", std::nullopt};
  tallykeep::testing::EnvGuard persist{"TALLYKEEP_PERSIST_FILE", std::nullopt};
  tallykeep::testing::EnvGuard interval{"TALLYKEEP_SAVE_INTERVAL", std::nullopt};
  tallykeep::testing::EnvGuard restore{"TALLYKEEP_RESTORE_ON_START", std::nullopt};
  tallykeep::testing::EnvGuard port{"TALLYKEEP_GATEWAY_PORT", std::nullopt};
  tallykeep::testing::EnvGuard password{"TALLYKEEP_LOCAL_PASSWORD", std::nullopt};
};

} // namespace

void register_config_tests(std::vector<tallykeep::tests::TestCase> &tests) {
  using tallykeep::tests::require;
  namespace cfg = tallykeep::config;
  namespace th = tallykeep::testing;

  tests.push_back({"config_path_defaults_under_home", [] {
                     th::TempWorkspace ws;
                     const CleanEnv env;
                     const th::EnvGuard home("HOME", ws.path().string());
                     const ConfigOverrideGuard guard;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == ws.path() / ".tallykeep" / "config.toml",
                             "unexpected config path " + path.value().string());
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     th::TempWorkspace ws;
                     const CleanEnv env;
                     const th::EnvGuard home("HOME", ws.path().string());
                     const ConfigOverrideGuard guard;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &usage = loaded.value().usage_statistics;
                     require(usage.enabled, "collection should default on");
                     require(usage.persist_file.empty(), "persistence should default off");
                     require(usage.save_interval == "5m", "default interval should be 5m");
                     require(usage.restore_on_start, "restore should default on");
                     require(loaded.value().gateway.port == 8317, "default port mismatch");
                   }});

  tests.push_back({"load_config_reads_all_sections", [] {
                     th::TempWorkspace ws;
                     const CleanEnv env;
                     const ConfigOverrideGuard guard(ws.path() / "tallykeep.toml");
                     ws.create_file("tallykeep.toml", R"(
[usage_statistics]
enabled = true
persist_file = "~/.tallykeep/usage.json"
save_interval = "90s"
restore_on_start = false

[gateway]
host = "127.0.0.1"
port = 9000
local_management_password = "s3cret"

[observability]
backend = "none"
)");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &c = loaded.value();
                     require(c.usage_statistics.persist_file == "~/.tallykeep/usage.json",
                             "persist_file mismatch");
                     require(c.usage_statistics.save_interval == "90s", "interval mismatch");
                     require(!c.usage_statistics.restore_on_start, "restore mismatch");
                     require(c.gateway.port == 9000, "port mismatch");
                     require(c.gateway.local_management_password == "s3cret", "password mismatch");
                     require(c.observability.backend == "none", "backend mismatch");
                   }});

  tests.push_back({"load_config_rejects_unknown_keys", [] {
                     th::TempWorkspace ws;
                     const CleanEnv env;
                     const ConfigOverrideGuard guard(ws.path() / "c.toml");
                     ws.create_file("c.toml", "[usage_statistics]\npersist_fle = \"x\"\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "typo key should fail");
                     require(loaded.error().find("persist_fle") != std::string::npos,
                             "error should name the key");
                   }});

  tests.push_back({"load_config_rejects_out_of_range_port", [] {
                     const auto parsed = cfg::parse_config("[gateway]\nport = 70000\n");
                     require(!parsed.ok(), "port above 65535 should fail");
                   }});

  tests.push_back({"env_overrides_take_precedence", [] {
                     th::TempWorkspace ws;
                     const CleanEnv env;
                     const ConfigOverrideGuard guard(ws.path() / "c.toml");
                     ws.create_file("c.toml",
                                    "[usage_statistics]\npersist_file = \"/from/file.json\"\n");
                     const th::EnvGuard persist("TALLYKEEP_PERSIST_FILE", "/from/env.json");
                     const th::EnvGuard interval("TALLYKEEP_SAVE_INTERVAL", "30s");
                     const th::EnvGuard restore("TALLYKEEP_RESTORE_ON_START", "false");
                     const th::EnvGuard port("TALLYKEEP_GATEWAY_PORT", "9100");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &c = loaded.value();
                     require(c.usage_statistics.persist_file == "/from/env.json",
                             "env persist file should win");
                     require(c.usage_statistics.save_interval == "30s", "env interval should win");
                     require(!c.usage_statistics.restore_on_start, "env restore should win");
                     require(c.gateway.port == 9100, "env port should win");
                   }});

  tests.push_back({"config_path_env_override", [] {
                     th::TempWorkspace ws;
                     const CleanEnv env;
                     const ConfigOverrideGuard guard;
                     const auto target = ws.path() / "env.toml";
                     const th::EnvGuard path_env("TALLYKEEP_CONFIG_PATH", target.string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == target, "env config path should be used");
                   }});

  tests.push_back({"save_config_round_trips", [] {
                     th::TempWorkspace ws;
                     const CleanEnv env;
                     const ConfigOverrideGuard guard(ws.path() / "nested" / "c.toml");

                     cfg::Config config;
                     config.usage_statistics.persist_file = "~/usage \"quoted\".json";
                     config.usage_statistics.save_interval = "1h30m";
                     config.gateway.port = 9200;
                     config.gateway.local_management_password = "pw";
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(!std::filesystem::exists(ws.path() / "nested" / "c.toml.tmp"),
                             "temp file should be gone");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().usage_statistics.persist_file ==
                                 config.usage_statistics.persist_file,
                             "persist_file should survive quoting");
                     require(loaded.value().usage_statistics.save_interval == "1h30m",
                             "interval should round trip");
                     require(loaded.value().gateway.port == 9200, "port should round trip");
                     require(loaded.value().gateway.local_management_password == "pw",
                             "password should round trip");
                   }});

  tests.push_back({"validate_config_errors_and_warnings", [] {
                     cfg::Config config;
                     config.gateway.host = "bad host";
                     require(!cfg::validate_config(config).ok(), "host with space should fail");

                     config = cfg::Config{};
                     config.observability.backend = "prometheus";
                     require(!cfg::validate_config(config).ok(), "unknown backend should fail");

                     config = cfg::Config{};
                     config.observability.backend = "log, none";
                     config.usage_statistics.persist_file = "/tmp/x.json";
                     config.usage_statistics.enabled = false;
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "disabled collection should warn");
                   }});

  tests.push_back({"parse_save_interval_rules", [] {
                     using std::chrono::milliseconds;
                     auto empty = cfg::parse_save_interval("");
                     require(empty.interval == milliseconds(0) && !empty.warning.has_value(),
                             "empty disables silently");
                     auto zero = cfg::parse_save_interval("0");
                     require(zero.interval == milliseconds(0) && !zero.warning.has_value(),
                             "zero disables silently");
                     auto valid = cfg::parse_save_interval("90s");
                     require(valid.interval == milliseconds(90'000) && !valid.warning.has_value(),
                             "90s should parse");
                     auto garbage = cfg::parse_save_interval("soon");
                     require(garbage.interval == milliseconds(0) && garbage.warning.has_value(),
                             "garbage disables with warning");
                     require(garbage.warning->find("\"soon\"") != std::string::npos,
                             "warning should quote the value");
                     auto negative = cfg::parse_save_interval("-5s");
                     require(negative.interval == milliseconds(0) && negative.warning.has_value(),
                             "negative disables with warning");
                   }});

  tests.push_back({"parse_save_interval_rejects_out_of_range", [] {
                     using std::chrono::milliseconds;
                     auto huge = cfg::parse_save_interval("3000000h");
                     require(huge.interval == milliseconds(0) && huge.warning.has_value(),
                             "an interval beyond the clock range disables with warning");
                     auto longest = cfg::parse_save_interval("2500000h");
                     require(longest.interval == milliseconds(9'000'000'000'000) &&
                                 !longest.warning.has_value(),
                             "an interval within range should be kept");
                   }});
}
