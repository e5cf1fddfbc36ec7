#pragma once

#include <httplib.h>
#include <string>

#include "metrics/exposition_serializer.h"
#include "metrics/metric_registry.h"

namespace chitty {

/// httplib matches GET patterns as regular expressions; this returns a
/// pattern that matches `path` literally. Throws std::invalid_argument for
/// paths containing "/:", which httplib reads as a path parameter.
std::string toRoutePattern(const std::string& path);

/// Scrape and liveness routes backed by a MetricRegistry.
class MetricsEndpoints {
public:
    explicit MetricsEndpoints(metrics::MetricRegistry& registry,
                              std::string metrics_path = "/metrics",
                              std::string health_path = "/health");

    void registerRoutes(httplib::Server& server);

    const std::string& metricsPath() const { return metrics_path_; }
    const std::string& healthPath() const { return health_path_; }

private:
    metrics::MetricRegistry& registry_;
    metrics::ExpositionSerializer serializer_;
    std::string metrics_path_;
    std::string health_path_;
};

}  // namespace chitty
