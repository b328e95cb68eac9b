#include "skillsref/observability/factory.hpp"

#include "skillsref/common/fs.hpp"
#include "skillsref/observability/log_observer.hpp"
#include "skillsref/observability/multi_observer.hpp"
#include "skillsref/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>

namespace skillsref::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                           std::ostream &log_out) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const LogLevel level = parse_log_level(config.observability.level);
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(level, log_out);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::to_lower(common::trim(part));
      if (p == "log") {
        multi->add(std::make_unique<LogObserver>(level, log_out));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>(level, log_out);
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  return create_observer(config, std::cerr);
}

} // namespace skillsref::observability
