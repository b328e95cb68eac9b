#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace skillsref::observability {

struct SkillReadEvent {
  std::string path;
  bool success = false;
};

struct ValidationEvent {
  std::string path;
  std::size_t error_count = 0;
};

struct PromptRenderEvent {
  std::size_t skill_count = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SkillReadEvent, ValidationEvent, PromptRenderEvent, ErrorEvent>;

struct ParseLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct ValidationErrorsMetric {
  std::size_t count = 0;
};

using ObserverMetric = std::variant<ParseLatencyMetric, ValidationErrorsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace skillsref::observability
