#pragma once

#include "skillsref/config/schema.hpp"
#include "skillsref/observability/observer.hpp"

#include <memory>
#include <ostream>

namespace skillsref::observability {

/// Build the observer named by `observability.backend` ("log", "none"/"noop",
/// or a comma list). Unknown names fall back to the log backend, which writes
/// to `log_out`.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                                         std::ostream &log_out);

/// Same as above, logging to stderr.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace skillsref::observability
