#pragma once

#include "codespaces/observability/observer.hpp"

namespace codespaces::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace codespaces::observability
