#pragma once

#include <string>

#include "metrics/metric_registry.h"

namespace chitty::metrics {

/// numerator / denominator per label set, for two counter families with the
/// same label names. Label sets present in either family are emitted; a zero
/// or missing denominator yields 0.
DerivedGaugeFn ratio_of(std::string numerator_family, std::string denominator_family);

}  // namespace chitty::metrics
