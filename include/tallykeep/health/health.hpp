#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace tallykeep::health {

enum class ComponentState { Starting, Ok, Error, Stopped };

[[nodiscard]] std::string component_state_to_string(ComponentState state);

struct ComponentStatus {
  ComponentState state = ComponentState::Starting;
  std::size_t error_count = 0;
  std::optional<std::string> last_error;
  std::string updated_at;
  std::optional<std::string> last_ok;
};

struct HealthSnapshot {
  std::map<std::string, ComponentStatus> components;

  // "ok" unless any component is in the error state.
  [[nodiscard]] std::string overall() const;
};

void mark_component_starting(const std::string &name);
void mark_component_ok(const std::string &name);
void mark_component_error(const std::string &name, const std::string &error);
void mark_component_stopped(const std::string &name);

[[nodiscard]] std::optional<ComponentStatus> get_component(const std::string &name);
[[nodiscard]] HealthSnapshot snapshot();
[[nodiscard]] std::string snapshot_json();
void clear();

} // namespace tallykeep::health
