#pragma once

#include "codespaces/observability/observer.hpp"

#include <memory>

namespace codespaces::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);

void record_config_loaded(const std::string &env_file);
void record_fetch_start(const std::string &url);
void record_fetch_end(std::uint16_t status, std::size_t records,
                      std::chrono::milliseconds latency);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace codespaces::observability
