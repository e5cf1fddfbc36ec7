#include "metrics/derived_gauges.h"

#include <map>
#include <utility>

namespace chitty::metrics {

DerivedGaugeFn ratio_of(std::string numerator_family, std::string denominator_family) {
    return [numerator = std::move(numerator_family),
            denominator = std::move(denominator_family)](const RegistrySnapshot& snapshot) {
        // label set -> (numerator, denominator)
        std::map<LabelKey, std::pair<double, double>> totals;
        if (const auto* num = snapshot.find(numerator)) {
            for (const auto& series : num->counters) totals[series.labels].first += series.value;
        }
        if (const auto* den = snapshot.find(denominator)) {
            for (const auto& series : den->counters) totals[series.labels].second += series.value;
        }

        std::vector<GaugeSample> samples;
        samples.reserve(totals.size());
        for (const auto& kv : totals) {
            const double den_value = kv.second.second;
            const double ratio = den_value > 0.0 ? kv.second.first / den_value : 0.0;
            samples.push_back(GaugeSample{kv.first, ratio});
        }
        return samples;
    };
}

}  // namespace chitty::metrics
