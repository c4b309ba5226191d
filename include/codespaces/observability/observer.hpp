#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace codespaces::observability {

struct ConfigLoadedEvent {
  std::string env_file;
};

struct FetchStartEvent {
  std::string url;
};

struct FetchEndEvent {
  std::uint16_t status = 0;
  std::size_t records = 0;
  std::chrono::milliseconds latency{0};
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ConfigLoadedEvent, FetchStartEvent, FetchEndEvent, WarningEvent, ErrorEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace codespaces::observability
