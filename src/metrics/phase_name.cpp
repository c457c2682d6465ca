/***
 * Name: pyscope::metrics::PhaseName
 * Purpose: Stable display name for a metrics phase.
 */
#include "pyscope/metrics/phase_name.h"

namespace pyscope::metrics {

const char* PhaseName(Metrics::Phase phase) {
  switch (phase) {
    case Metrics::Phase::ReadFile: return "ReadFile";
    case Metrics::Phase::Parse: return "Parse";
    case Metrics::Phase::Extract: return "Extract";
    case Metrics::Phase::Render: return "Render";
    case Metrics::Phase::BuildGraph: return "BuildGraph";
    case Metrics::Phase::Export: return "Export";
  }
  return "Unknown";
}

}  // namespace pyscope::metrics
