#include "tallykeep/health/health.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/common/json_util.hpp"

#include <mutex>
#include <sstream>

namespace tallykeep::health {

namespace {

std::mutex g_mutex;
std::map<std::string, ComponentStatus> g_components;

template <typename Fn> void update_component(const std::string &name, Fn &&fn) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = g_components[name];
  component.updated_at = common::now_rfc3339();
  fn(component);
}

} // namespace

std::string component_state_to_string(const ComponentState state) {
  switch (state) {
  case ComponentState::Starting:
    return "starting";
  case ComponentState::Ok:
    return "ok";
  case ComponentState::Error:
    return "error";
  case ComponentState::Stopped:
    return "stopped";
  }
  return "unknown";
}

std::string HealthSnapshot::overall() const {
  for (const auto &[name, status] : components) {
    if (status.state == ComponentState::Error) {
      return "degraded";
    }
  }
  return "ok";
}

void mark_component_starting(const std::string &name) {
  update_component(name, [](ComponentStatus &component) {
    component.state = ComponentState::Starting;
    component.last_error.reset();
  });
}

void mark_component_ok(const std::string &name) {
  update_component(name, [](ComponentStatus &component) {
    component.state = ComponentState::Ok;
    component.last_ok = component.updated_at;
    component.last_error.reset();
  });
}

void mark_component_error(const std::string &name, const std::string &error) {
  update_component(name, [&error](ComponentStatus &component) {
    component.state = ComponentState::Error;
    component.last_error = error;
    ++component.error_count;
  });
}

void mark_component_stopped(const std::string &name) {
  update_component(name,
                   [](ComponentStatus &component) { component.state = ComponentState::Stopped; });
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto it = g_components.find(name);
  if (it == g_components.end()) {
    return std::nullopt;
  }
  return it->second;
}

HealthSnapshot snapshot() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return HealthSnapshot{.components = g_components};
}

std::string snapshot_json() {
  const auto snap = snapshot();
  std::ostringstream json;
  json << "{\"status\":" << common::json_quote(snap.overall()) << ",\"components\":{";
  bool first = true;
  for (const auto &[name, status] : snap.components) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << common::json_quote(name) << ":{";
    json << "\"status\":" << common::json_quote(component_state_to_string(status.state)) << ",";
    json << "\"error_count\":" << status.error_count;
    if (!status.updated_at.empty()) {
      json << ",\"updated_at\":" << common::json_quote(status.updated_at);
    }
    if (status.last_ok.has_value()) {
      json << ",\"last_ok\":" << common::json_quote(*status.last_ok);
    }
    if (status.last_error.has_value()) {
      json << ",\"last_error\":" << common::json_quote(*status.last_error);
    }
    json << "}";
  }
  json << "}}";
  return json.str();
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.clear();
}

} // namespace tallykeep::health
