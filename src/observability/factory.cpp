#include "mcpbridge/observability/factory.hpp"

#include "mcpbridge/common/fs.hpp"
#include "mcpbridge/observability/log_observer.hpp"

namespace mcpbridge::observability {

namespace {

/// Selected by `backend = "none"`; the proxy then writes nothing to stderr.
class SilentObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<SilentObserver>();
  }
  // validate_config warns about unknown names; stderr logging stays on.
  return std::make_unique<LogObserver>();
}

} // namespace mcpbridge::observability
