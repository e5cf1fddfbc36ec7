#include "metrics/sample_data.h"

#include <array>
#include <random>
#include <spdlog/spdlog.h>

namespace chitty::metrics {

namespace {
const std::array<const char*, 3> kModels{"gpt-4", "claude-sonnet", "groq/llama-3-70b"};
const std::array<const char*, 3> kTenants{"tenant-a", "tenant-b", "tenant-c"};
constexpr double kCacheHitProbability = 0.7;
}  // namespace

size_t generate_sample_data(GatewayMetrics& metrics, size_t count, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, kModels.size() - 1);
    std::uniform_real_distribution<double> duration(0.05, 2.0);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_real_distribution<double> cost(0.001, 0.05);

    spdlog::info("Generating {} sample requests", count);
    for (size_t i = 0; i < count; ++i) {
        RequestRecord request;
        request.model = kModels[pick(rng)];
        request.tenant = kTenants[pick(rng)];
        request.duration_seconds = duration(rng);
        request.cached = coin(rng) < kCacheHitProbability;
        request.cost_cents = request.cached ? 0.0 : cost(rng);
        metrics.record_request(request);
    }
    spdlog::info("Generated {} sample requests", count);
    return count;
}

}  // namespace chitty::metrics
