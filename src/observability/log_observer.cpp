#include "codespaces/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace codespaces::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ConfigLoadedEvent>) {
          log_line(*out_, "DEBUG", "config.env_file path=" + evt.env_file);
        } else if constexpr (std::is_same_v<T, FetchStartEvent>) {
          log_line(*out_, "INFO", "fetch.start url=" + evt.url);
        } else if constexpr (std::is_same_v<T, FetchEndEvent>) {
          log_line(*out_, "INFO", "fetch.end status=" + std::to_string(evt.status) +
                                      " records=" + std::to_string(evt.records) +
                                      " latency_ms=" + std::to_string(evt.latency.count()));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(*out_, "WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(*out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::flush() { out_->flush(); }

} // namespace codespaces::observability
