#pragma once

#include "codespaces/observability/observer.hpp"

#include <iosfwd>

namespace codespaces::observability {

/// Writes one "[LEVEL] message" line per event.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream *out_;
};

} // namespace codespaces::observability
