#pragma once

#include <cstddef>
#include <cstdint>

#include "metrics/gateway_metrics.h"

namespace chitty::metrics {

/// Records `count` synthetic requests: three models, three tenants, ~70%
/// cache hits, cached requests cost nothing. Same seed, same traffic.
/// Returns the number of requests recorded.
size_t generate_sample_data(GatewayMetrics& metrics, size_t count = 1000, uint32_t seed = 5489u);

}  // namespace chitty::metrics
