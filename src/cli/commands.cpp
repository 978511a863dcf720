#include "tallykeep/cli/commands.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/config/config.hpp"
#include "tallykeep/observability/factory.hpp"
#include "tallykeep/observability/global.hpp"
#include "tallykeep/runtime/lifecycle.hpp"
#include "tallykeep/usage/file_store.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace tallykeep::cli {

namespace {

std::string version_string() {
#ifdef TALLYKEEP_VERSION
  std::string version = TALLYKEEP_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef TALLYKEEP_GIT_COMMIT
  const std::string commit = TALLYKEEP_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "tallykeep " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// Removes `--name VALUE` or `--name=VALUE`. Returns false when the option is
// present without a value.
bool take_option(std::vector<std::string> &args, const std::string &name, std::string &out_value,
                 bool &found) {
  found = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      found = true;
      return true;
    }
    if (common::starts_with(args[i], name + "=")) {
      out_value = args[i].substr(name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      found = true;
      return !out_value.empty();
    }
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  std::string path;
  bool found = false;
  if (!take_option(args, "--config", path, found)) {
    error = "missing value for --config";
    return false;
  }
  if (found) {
    config::set_config_path_override(path);
  }
  return true;
}

bool reject_leftovers(const std::vector<std::string> &args, const std::string &command) {
  if (args.empty()) {
    return false;
  }
  std::cerr << "unexpected argument for " << command << ": " << args.front() << "\n";
  return true;
}

int run_service_command(std::vector<std::string> args) {
  std::string password;
  bool has_password = false;
  if (!take_option(args, "--local-password", password, has_password)) {
    std::cerr << "missing value for --local-password\n";
    return 1;
  }
  if (reject_leftovers(args, "run")) {
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << validated.error() << "\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(cfg.value()));
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }

  if (const auto path = config::config_path(); path.ok()) {
    std::cerr << "[tallykeep] starting " << version_string() << " config=" << path.value().string()
              << "\n";
  }

  runtime::LifecycleOptions options;
  options.local_password =
      has_password ? password : cfg.value().gateway.local_management_password;
  auto status = runtime::run_service(cfg.value(), options);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  return 0;
}

int show_usage_file(std::vector<std::string> args) {
  std::string file;
  bool has_file = false;
  if (!take_option(args, "--file", file, has_file)) {
    std::cerr << "missing value for --file\n";
    return 1;
  }
  if (reject_leftovers(args, "usage show")) {
    return 1;
  }

  if (!has_file) {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return 1;
    }
    file = cfg.value().usage_statistics.persist_file;
  }
  file = common::resolve_home_path(common::trim(file));
  if (file.empty()) {
    std::cerr << "usage persistence is not configured; pass --file or set "
                 "usage_statistics.persist_file\n";
    return 1;
  }

  const auto result = usage::read_envelope(file);
  switch (result.status) {
  case usage::LoadStatus::NotFound:
    std::cout << "No usage file at " << file << "\n";
    return 0;
  case usage::LoadStatus::Corrupt:
  case usage::LoadStatus::UnsupportedVersion:
  case usage::LoadStatus::IoError:
    std::cerr << file << ": " << usage::load_status_to_string(result.status) << ": "
              << result.error << "\n";
    return 1;
  case usage::LoadStatus::Loaded:
    break;
  }

  const auto &data = result.envelope->data;
  std::cout << "File:            " << file << "\n";
  std::cout << "Saved at:        " << result.envelope->saved_at << "\n";
  std::cout << "Total requests:  " << data.total_requests << "\n";
  std::cout << "Succeeded:       " << data.success_count << "\n";
  std::cout << "Failed:          " << data.failure_count << "\n";
  std::cout << "Total tokens:    " << data.total_tokens << "\n";
  for (const auto &[api_name, api] : data.apis) {
    std::cout << "\n" << api_name << "  requests=" << api.total_requests
              << " tokens=" << api.total_tokens << "\n";
    for (const auto &[model_name, model] : api.models) {
      std::cout << "  " << model_name << "  requests=" << model.total_requests
                << " tokens=" << model.total_tokens << "\n";
    }
  }
  return 0;
}

int run_usage(std::vector<std::string> args) {
  if (args.empty() || args[0] == "show") {
    if (!args.empty()) {
      args.erase(args.begin());
    }
    return show_usage_file(std::move(args));
  }
  std::cerr << "unknown usage command: " << args[0] << "\n";
  return 1;
}

int run_init(std::vector<std::string> args) {
  std::string persist_file;
  bool has_persist_file = false;
  if (!take_option(args, "--persist-file", persist_file, has_persist_file)) {
    std::cerr << "missing value for --persist-file\n";
    return 1;
  }
  const bool force = take_flag(args, "--force");
  if (reject_leftovers(args, "init")) {
    return 1;
  }

  auto path = config::config_path();
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  if (config::config_exists() && !force) {
    std::cerr << "config already exists at " << path.value().string()
              << " (use --force to overwrite)\n";
    return 1;
  }

  config::Config cfg;
  cfg.usage_statistics.persist_file =
      has_persist_file ? persist_file : "~/.tallykeep/usage-statistics.json";
  auto saved = config::save_config(cfg);
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return 1;
  }
  std::cout << "Wrote " << path.value().string() << "\n";
  return 0;
}

int print_config_path() {
  auto path = config::config_path();
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  std::cout << path.value().string() << "\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: tallykeep [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run [--local-password PWD]   Run the service until SIGINT, SIGTERM or keep-alive "
               "idle\n";
  std::cout << "  usage show [--file PATH]     Print totals from a persisted usage file\n";
  std::cout << "  init [--persist-file PATH]   Write a default configuration (--force to "
               "overwrite)\n";
  std::cout << "  config-path                  Print the configuration file location\n";
  std::cout << "  version                      Show version\n";
  std::cout << "  help                         Show this message\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    return print_config_path();
  }
  if (subcommand == "run") {
    return run_service_command(std::move(args));
  }
  if (subcommand == "usage") {
    return run_usage(std::move(args));
  }
  if (subcommand == "init") {
    return run_init(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace tallykeep::cli
