/***
 * Name: pyscope::metrics::Metrics::reg_
 * Purpose: Define the static metrics registry storage and its lock.
 * Inputs: N/A
 * Outputs: Singleton-style storage for metrics across stages.
 * Theory of Operation: One definition for the class-declared static members.
 */
#include "pyscope/metrics/metrics.h"

#include <mutex>

namespace pyscope {
namespace metrics {

Metrics::Registry Metrics::reg_{};
std::mutex Metrics::mu_{};

}  // namespace metrics
}  // namespace pyscope
