#pragma once

#include "mcpbridge/config/schema.hpp"
#include "mcpbridge/observability/observer.hpp"

#include <memory>

namespace mcpbridge::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace mcpbridge::observability
