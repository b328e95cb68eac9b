#pragma once

#include "skillsref/observability/observer.hpp"

#include <iosfwd>
#include <string>

namespace skillsref::observability {

enum class LogLevel {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

/// Unknown names map to Warn.
[[nodiscard]] LogLevel parse_log_level(const std::string &name);
[[nodiscard]] std::string_view log_level_to_string(LogLevel level);

class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Warn);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
};

} // namespace skillsref::observability
