#pragma once

#include "codespaces/config/schema.hpp"
#include "codespaces/observability/observer.hpp"

#include <memory>

namespace codespaces::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace codespaces::observability
