#pragma once

#include "tallykeep/config/schema.hpp"
#include "tallykeep/observability/observer.hpp"

#include <memory>

namespace tallykeep::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace tallykeep::observability
