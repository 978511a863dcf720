#include "tallykeep/observability/factory.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/observability/log_observer.hpp"
#include "tallykeep/observability/multi_observer.hpp"
#include "tallykeep/observability/noop_observer.hpp"

#include <sstream>
#include <vector>

namespace tallykeep::observability {

namespace {

std::vector<std::string> split_backends(const std::string &raw) {
  std::vector<std::string> names;
  std::stringstream stream(common::to_lower(raw));
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::trim(part);
    if (!part.empty() && part != "none" && part != "noop") {
      names.push_back(part);
    }
  }
  return names;
}

// Unknown names fall back to the log backend so misconfiguration stays visible.
std::unique_ptr<IObserver> create_backend(const std::string &) {
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = split_backends(config.observability.backend);
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return create_backend(names.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    multi->add(create_backend(name));
  }
  return multi;
}

} // namespace tallykeep::observability
