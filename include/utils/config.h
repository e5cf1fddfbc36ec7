#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "metrics/gateway_metrics.h"

namespace chitty {

struct ExporterConfig {
    int port{9090};
    std::string bind_address{"0.0.0.0"};
    std::string metrics_path{"/metrics"};
    std::string health_path{"/health"};
    bool gzip_enabled{true};
    std::vector<double> duration_buckets{metrics::default_duration_buckets()};
    size_t max_series_per_family{0};  // 0 = unlimited
};

/// Defaults, then the JSON file (CHITTY_CONFIG or ~/.chittycan/exporter.json),
/// then CHITTY_* environment overrides. Malformed values are skipped.
ExporterConfig loadExporterConfig();

/// Same as loadExporterConfig(), plus a one-line description of the sources used.
std::pair<ExporterConfig, std::string> loadExporterConfigWithLog();

}  // namespace chitty
