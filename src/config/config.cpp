#include "tallykeep/config/config.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace tallykeep::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tallykeep";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

const std::set<std::string> &known_keys() {
  static const std::set<std::string> keys = {
      "usage_statistics.enabled",       "usage_statistics.persist_file",
      "usage_statistics.save_interval", "usage_statistics.restore_on_start",
      "gateway.host",                   "gateway.port",
      "gateway.local_management_password", "observability.backend",
  };
  return keys;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("TALLYKEEP_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  for (const char ch : host) {
    if (ch == ' ' || ch == '/' || ch == '\t') {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (const auto file = env_value("TALLYKEEP_PERSIST_FILE")) {
    config.usage_statistics.persist_file = *file;
  }
  if (const auto interval = env_value("TALLYKEEP_SAVE_INTERVAL")) {
    config.usage_statistics.save_interval = *interval;
  }
  if (const auto restore = env_value("TALLYKEEP_RESTORE_ON_START")) {
    const std::string normalized = common::to_lower(common::trim(*restore));
    if (normalized == "true" || normalized == "1") {
      config.usage_statistics.restore_on_start = true;
    } else if (normalized == "false" || normalized == "0") {
      config.usage_statistics.restore_on_start = false;
    }
  }
  if (const auto port = env_value("TALLYKEEP_GATEWAY_PORT")) {
    try {
      const auto parsed = std::stoul(*port);
      if (parsed <= std::numeric_limits<std::uint16_t>::max()) {
        config.gateway.port = static_cast<std::uint16_t>(parsed);
      }
    } catch (const std::exception &) {
      // keep the configured port
    }
  }
  if (const auto password = env_value("TALLYKEEP_LOCAL_PASSWORD")) {
    config.gateway.local_management_password = *password;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &usage = config.usage_statistics;
  usage.enabled = doc.get_bool("usage_statistics.enabled", usage.enabled);
  usage.persist_file = doc.get_string("usage_statistics.persist_file", usage.persist_file);
  usage.save_interval = doc.get_string("usage_statistics.save_interval", usage.save_interval);
  usage.restore_on_start =
      doc.get_bool("usage_statistics.restore_on_start", usage.restore_on_start);

  config.gateway.host = doc.get_string("gateway.host", config.gateway.host);
  const auto port = doc.get_u64("gateway.port", config.gateway.port);
  if (port > std::numeric_limits<std::uint16_t>::max()) {
    return common::Result<Config>::failure("gateway.port out of range: " + std::to_string(port));
  }
  config.gateway.port = static_cast<std::uint16_t>(port);
  config.gateway.local_management_password = doc.get_string(
      "gateway.local_management_password", config.gateway.local_management_password);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  for (const auto &[key, value] : doc.values) {
    if (!known_keys().contains(key)) {
      return common::Result<Config>::failure("Unknown config key: " + key);
    }
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_from(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }
  return load_config_from(cfg_path_result.value());
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    const auto ensured = common::ensure_dir(path.parent_path());
    if (!ensured.ok()) {
      return common::Status::error(ensured.error());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  const auto &usage = config.usage_statistics;
  file << "[usage_statistics]\n";
  file << "enabled = " << bool_to_toml(usage.enabled) << "\n";
  file << "persist_file = " << common::quote_toml_string(usage.persist_file) << "\n";
  file << "save_interval = " << common::quote_toml_string(usage.save_interval) << "\n";
  file << "restore_on_start = " << bool_to_toml(usage.restore_on_start) << "\n";

  file << "\n[gateway]\n";
  file << "host = " << common::quote_toml_string(config.gateway.host) << "\n";
  file << "port = " << config.gateway.port << "\n";
  if (!config.gateway.local_management_password.empty()) {
    file << "local_management_password = "
         << common::quote_toml_string(config.gateway.local_management_password) << "\n";
  }

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!is_valid_host(config.gateway.host)) {
    return common::Result<std::vector<std::string>>::failure("gateway.host is invalid: " +
                                                              config.gateway.host);
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::trim(part);
    if (!part.empty() && part != "log" && part != "none" && part != "noop") {
      return common::Result<std::vector<std::string>>::failure(
          "Invalid observability.backend: " + config.observability.backend);
    }
  }

  const auto &usage = config.usage_statistics;
  if (!common::trim(usage.persist_file).empty() && !usage.enabled) {
    warnings.push_back(
        "usage_statistics.persist_file is set while usage_statistics.enabled is false");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

SaveInterval parse_save_interval(const std::string &raw) {
  SaveInterval out;
  const std::string value = common::trim(raw);
  if (value.empty() || value == "0") {
    return out;
  }

  const auto parsed = common::parse_duration(value);
  if (!parsed.ok() || parsed.value().count() <= 0) {
    out.warning = "Invalid save-interval \"" + raw + "\", disabling periodic save";
    return out;
  }
  out.interval = parsed.value();
  return out;
}

} // namespace tallykeep::config
