/***
 * Name: pyscope::metrics::Metrics::AddCounter / Reset
 * Purpose: Accumulate named counters; clear the registry between runs.
 * Inputs:
 *   - name: counter label (e.g. "functions")
 *   - delta: amount to add
 * Outputs: None
 * Theory of Operation: Linear lookup keeps counters in first-recorded order;
 *   there are only a handful of them. No-op while metrics are disabled.
 */
#include "pyscope/metrics/metrics.h"

#include <cstdint>
#include <mutex>
#include <string>

namespace pyscope::metrics {

void Metrics::AddCounter(const std::string& name, std::uint64_t delta) {
  const std::lock_guard<std::mutex> lock(mu_);
  if (!reg_.enabled) return;
  for (auto& entry : reg_.counters) {
    if (entry.first == name) {
      entry.second += delta;
      return;
    }
  }
  reg_.counters.emplace_back(name, delta);
}

void Metrics::Reset() {
  const std::lock_guard<std::mutex> lock(mu_);
  const bool enabled = reg_.enabled;
  reg_ = Registry{};
  reg_.enabled = enabled;
}

}  // namespace pyscope::metrics
