#pragma once

#include <string>
#include <vector>

#include "metrics/metric_registry.h"

namespace chitty::metrics {

inline constexpr const char* kRequestsTotal = "chitty_requests_total";
inline constexpr const char* kCacheHitsTotal = "chitty_cache_hits_total";
inline constexpr const char* kCacheRequestsTotal = "chitty_cache_requests_total";
inline constexpr const char* kCacheHitRate = "chitty_cache_hit_rate";
inline constexpr const char* kCostCentsTotal = "chitty_cost_cents_total";
inline constexpr const char* kRequestDurationSeconds = "chitty_request_duration_seconds";
inline constexpr const char* kFallbackEventsTotal = "chitty_fallback_events_total";
inline constexpr const char* kBudgetOverrunsTotal = "chitty_budget_overruns_total";

/// 10ms .. 10s, +Inf is added by the registry.
std::vector<double> default_duration_buckets();

struct GatewayMetricsOptions {
    std::vector<double> duration_buckets{default_duration_buckets()};
};

/// One completed request through the gateway.
struct RequestRecord {
    std::string model;
    std::string tenant;
    double duration_seconds{0.0};
    bool cached{false};
    double cost_cents{0.0};
};

/// Gateway-level view over a MetricRegistry: declares the chitty_* families
/// on construction and records traffic into them.
class GatewayMetrics {
public:
    explicit GatewayMetrics(MetricRegistry& registry, GatewayMetricsOptions options = {});

    /// Throws InvalidDeltaError for a negative or non-finite cost and
    /// MetricsError(kInvalidObservation) for a non-finite duration, in both
    /// cases before any series is touched.
    void record_request(const RequestRecord& request);

    void record_fallback(const std::string& from_model, const std::string& to_model);
    void record_budget_overrun(const std::string& tenant);

    MetricRegistry& registry() { return registry_; }

private:
    MetricRegistry& registry_;
};

}  // namespace chitty::metrics
