#pragma once

#include "pyscope/metrics/metrics.h"

namespace pyscope::metrics {

const char* PhaseName(Metrics::Phase phase);

}  // namespace pyscope::metrics
