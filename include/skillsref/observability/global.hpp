#pragma once

#include "skillsref/observability/observer.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace skillsref::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_skill_read(const std::string &path, bool success);
void record_validation(const std::string &path, std::size_t error_count);
void record_prompt_render(std::size_t skill_count);
void record_parse_latency(std::chrono::microseconds latency);
void record_error(const std::string &component, const std::string &message);

} // namespace skillsref::observability
