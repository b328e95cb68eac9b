#pragma once

#include "skillsref/observability/observer.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace skillsref::observability {

/// Fans out to child observers. At most one child per backend name is kept,
/// so "log,log" logs each line once.
class MultiObserver final : public IObserver {
public:
  /// Returns false when the observer is null or its backend is already held.
  bool add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] bool has(std::string_view backend) const;

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace skillsref::observability
