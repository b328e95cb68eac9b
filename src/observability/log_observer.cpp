#include "skillsref/observability/log_observer.hpp"

#include "skillsref/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace skillsref::observability {

LogLevel parse_log_level(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Warn;
}

std::string_view log_level_to_string(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Warn:
  default:
    return "WARN";
  }
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  *out_ << "[" << log_level_to_string(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SkillReadEvent>) {
          log_line(evt.success ? LogLevel::Debug : LogLevel::Warn,
                   "skill.read path=" + evt.path +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ValidationEvent>) {
          log_line(evt.error_count == 0 ? LogLevel::Info : LogLevel::Warn,
                   "skill.validate path=" + evt.path +
                       " errors=" + std::to_string(evt.error_count));
        } else if constexpr (std::is_same_v<T, PromptRenderEvent>) {
          log_line(LogLevel::Info, "prompt.render skills=" + std::to_string(evt.skill_count));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ParseLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.parse_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ValidationErrorsMetric>) {
          log_line(LogLevel::Debug, "metric.validation_errors=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace skillsref::observability
