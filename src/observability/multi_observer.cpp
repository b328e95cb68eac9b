#include "skillsref/observability/multi_observer.hpp"

#include <algorithm>

namespace skillsref::observability {

bool MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr || has(observer->name())) {
    return false;
  }
  observers_.push_back(std::move(observer));
  return true;
}

bool MultiObserver::has(const std::string_view backend) const {
  return std::any_of(observers_.begin(), observers_.end(),
                     [backend](const auto &observer) { return observer->name() == backend; });
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace skillsref::observability
