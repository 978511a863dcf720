#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tallykeep/cli/commands.hpp"
#include "tallykeep/config/config.hpp"
#include "tallykeep/usage/file_store.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliResult {
  int code = 0;
  std::string out;
  std::string err;
};

CliResult run(std::vector<std::string> args) {
  args.insert(args.begin(), "tallykeep");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }

  std::ostringstream out;
  std::ostringstream err;
  auto *old_out = std::cout.rdbuf(out.rdbuf());
  auto *old_err = std::cerr.rdbuf(err.rdbuf());
  CliResult result;
  try {
    result.code = tallykeep::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  } catch (...) {
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
    throw;
  }
  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  result.out = out.str();
  result.err = err.str();
  return result;
}

// run_cli applies --config globally; restore the previous override afterwards.
struct OverrideRestore {
  std::optional<std::filesystem::path> previous = tallykeep::config::config_path_override();
  ~OverrideRestore() {
    if (previous.has_value()) {
      tallykeep::config::set_config_path_override(*previous);
    } else {
      tallykeep::config::clear_config_path_override();
    }
  }
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_cli_tests(std::vector<tallykeep::tests::TestCase> &tests) {
  using tallykeep::tests::require;
  namespace th = tallykeep::testing;
  namespace usage = tallykeep::usage;

  tests.push_back({"cli_version_and_help", [] {
                     const auto version = run({"--version"});
                     require(version.code == 0, "version should succeed");
                     require(version.out.rfind("tallykeep ", 0) == 0, version.out);

                     const auto help = run({});
                     require(help.code == 0, "no arguments prints help");
                     require(contains(help.out, "usage show"), help.out);

                     const auto unknown = run({"frobnicate"});
                     require(unknown.code == 1, "unknown command should fail");
                     require(contains(unknown.err, "unknown command: frobnicate"), unknown.err);
                   }});

  tests.push_back({"cli_config_path_honours_override", [] {
                     const OverrideRestore restore;
                     th::TempWorkspace ws;
                     const auto path = ws.path() / "custom.toml";
                     const auto result = run({"--config", path.string(), "config-path"});
                     require(result.code == 0, result.err);
                     require(result.out == path.string() + "\n", result.out);

                     const auto missing = run({"config-path", "--config"});
                     require(missing.code == 1, "--config without a value should fail");
                   }});

  tests.push_back({"cli_init_writes_config_once", [] {
                     const OverrideRestore restore;
                     th::TempWorkspace ws;
                     const auto path = ws.path() / "config.toml";
                     const auto usage_path = (ws.path() / "usage.json").string();
                     const auto first = run({"--config=" + path.string(), "init",
                                             "--persist-file", usage_path});
                     require(first.code == 0, first.err);
                     require(std::filesystem::exists(path), "config file should exist");

                     const auto loaded = tallykeep::config::load_config_from(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().usage_statistics.persist_file == usage_path,
                             "persist file should be written");

                     const auto second = run({"--config", path.string(), "init"});
                     require(second.code == 1, "existing config needs --force");
                     require(contains(second.err, "--force"), second.err);

                     const auto forced = run({"--config", path.string(), "init", "--force"});
                     require(forced.code == 0, forced.err);
                   }});

  tests.push_back({"cli_usage_show_prints_totals", [] {
                     th::TempWorkspace ws;
                     const auto path = ws.path() / "usage.json";
                     const auto saved = usage::save_envelope(
                         path, usage::PersistedEnvelope{.version = usage::kUsageFileVersion,
                                                        .saved_at = "2026-01-03T00:00:00Z",
                                                        .data = th::sample_snapshot()});
                     require(saved.ok(), saved.error());

                     const auto result = run({"usage", "show", "--file", path.string()});
                     require(result.code == 0, result.err);
                     require(contains(result.out, "Total requests:  3"), result.out);
                     require(contains(result.out, "Failed:          1"), result.out);
                     require(contains(result.out, "Total tokens:    175"), result.out);
                     require(contains(result.out, "openai  requests=2"), result.out);
                     require(contains(result.out, "  sonnet  requests=1 tokens=10"), result.out);
                   }});

  tests.push_back({"cli_usage_show_missing_and_corrupt_files", [] {
                     th::TempWorkspace ws;
                     const auto missing =
                         run({"usage", "--file", (ws.path() / "absent.json").string()});
                     require(missing.code == 0, "missing file is not an error");
                     require(contains(missing.out, "No usage file"), missing.out);

                     ws.create_file("broken.json", "{\"version\":1,");
                     const auto corrupt =
                         run({"usage", "show", "--file", (ws.path() / "broken.json").string()});
                     require(corrupt.code == 1, "corrupt file should fail");
                     require(contains(corrupt.err, "corrupt"), corrupt.err);
                     require(ws.read_file("broken.json") == "{\"version\":1,",
                             "show must not quarantine the file");

                     ws.create_file("future.json", R"({"version":2,"saved_at":"x","data":{}})");
                     const auto future =
                         run({"usage", "show", "--file", (ws.path() / "future.json").string()});
                     require(future.code == 1, "unsupported version should fail");

                     const auto extra = run({"usage", "show", "--bogus"});
                     require(extra.code == 1, "unexpected arguments should fail");
                   }});
}
