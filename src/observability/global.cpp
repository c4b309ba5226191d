#include "codespaces/observability/global.hpp"

namespace codespaces::observability {

namespace {

// Single-threaded tool: installed once by the entry point.
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) { g_observer = std::move(observer); }

IObserver *get_global_observer() { return g_observer.get(); }

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_config_loaded(const std::string &env_file) {
  record_event(ConfigLoadedEvent{.env_file = env_file});
}

void record_fetch_start(const std::string &url) { record_event(FetchStartEvent{.url = url}); }

void record_fetch_end(const std::uint16_t status, const std::size_t records,
                      const std::chrono::milliseconds latency) {
  record_event(FetchEndEvent{.status = status, .records = records, .latency = latency});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace codespaces::observability
