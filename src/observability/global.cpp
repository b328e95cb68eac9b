#include "skillsref/observability/global.hpp"

#include <mutex>

namespace skillsref::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_skill_read(const std::string &path, const bool success) {
  record_event(SkillReadEvent{.path = path, .success = success});
}

void record_validation(const std::string &path, const std::size_t error_count) {
  record_event(ValidationEvent{.path = path, .error_count = error_count});
  record_metric(ValidationErrorsMetric{.count = error_count});
}

void record_prompt_render(const std::size_t skill_count) {
  record_event(PromptRenderEvent{.skill_count = skill_count});
}

void record_parse_latency(const std::chrono::microseconds latency) {
  record_metric(ParseLatencyMetric{.latency = latency});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace skillsref::observability
