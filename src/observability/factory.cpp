#include "codespaces/observability/factory.hpp"

#include "codespaces/common/fs.hpp"
#include "codespaces/observability/log_observer.hpp"
#include "codespaces/observability/noop_observer.hpp"

namespace codespaces::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace codespaces::observability
