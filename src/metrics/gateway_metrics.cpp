#include "metrics/gateway_metrics.h"

#include <cmath>
#include <spdlog/spdlog.h>
#include <utility>

#include "metrics/derived_gauges.h"
#include "metrics/metric_errors.h"

namespace chitty::metrics {

std::vector<double> default_duration_buckets() {
    return {0.01, 0.1, 0.5, 1.0, 2.0, 5.0, 10.0};
}

GatewayMetrics::GatewayMetrics(MetricRegistry& registry, GatewayMetricsOptions options)
    : registry_(registry) {
    registry_.register_counter(kRequestsTotal, "Total number of requests",
                               ValueFormat::integer(), {"model", "tenant"});
    registry_.register_counter(kCacheHitsTotal, "Total number of cache hits",
                               ValueFormat::integer(), {"model"});
    registry_.register_counter(kCacheRequestsTotal, "Total number of cacheable requests",
                               ValueFormat::integer(), {"model"});
    registry_.register_derived_gauge(kCacheHitRate, "Cache hit rate ratio (hits/requests)",
                                     ratio_of(kCacheHitsTotal, kCacheRequestsTotal),
                                     ValueFormat::fixed_or_zero(4));
    registry_.register_counter(kCostCentsTotal, "Total cost in USD cents",
                               ValueFormat::fixed(2), {"model", "tenant"});
    registry_.register_histogram(kRequestDurationSeconds, "Request duration in seconds",
                                 std::move(options.duration_buckets), ValueFormat::fixed(4), {"model"});
    registry_.register_counter(kFallbackEventsTotal, "Total number of provider fallback events",
                               ValueFormat::integer(), {"from_model", "to_model"});
    registry_.register_counter(kBudgetOverrunsTotal, "Total number of budget overrun incidents",
                               ValueFormat::integer(), {"tenant"});
    spdlog::debug("GatewayMetrics: {} families registered", registry_.family_count());
}

void GatewayMetrics::record_request(const RequestRecord& request) {
    if (!std::isfinite(request.cost_cents) || request.cost_cents < 0.0) {
        throw InvalidDeltaError("request cost must be a non-negative amount, got " +
                                std::to_string(request.cost_cents));
    }
    if (!std::isfinite(request.duration_seconds)) {
        throw MetricsError(MetricsErrorCode::kInvalidObservation, "request duration must be finite");
    }

    const LabelSet by_model_tenant{{"model", request.model}, {"tenant", request.tenant}};
    const LabelSet by_model{{"model", request.model}};

    registry_.record_counter(kRequestsTotal, by_model_tenant, 1);
    registry_.record_counter(kCacheRequestsTotal, by_model, 1);
    if (request.cached) {
        registry_.record_counter(kCacheHitsTotal, by_model, 1);
    }
    registry_.record_counter(kCostCentsTotal, by_model_tenant, request.cost_cents);
    registry_.record_histogram_observation(kRequestDurationSeconds, by_model, request.duration_seconds);
}

void GatewayMetrics::record_fallback(const std::string& from_model, const std::string& to_model) {
    registry_.record_counter(kFallbackEventsTotal, {{"from_model", from_model}, {"to_model", to_model}}, 1);
}

void GatewayMetrics::record_budget_overrun(const std::string& tenant) {
    registry_.record_counter(kBudgetOverrunsTotal, {{"tenant", tenant}}, 1);
}

}  // namespace chitty::metrics
