#include "metrics/metric_registry.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

#include "metrics/metric_errors.h"

namespace chitty::metrics {

namespace detail {

struct HistogramState {
    std::vector<uint64_t> bucket_counts;
    double sum{0.0};
    uint64_t count{0};
};

struct FamilyState {
    // Fixed at registration
    std::string name;
    std::string help;
    MetricType type{MetricType::Counter};
    ValueFormat format;
    std::vector<double> bounds;
    DerivedGaugeFn derive;

    // Guarded by mutex
    std::mutex mutex;
    bool shape_fixed{false};
    std::vector<std::string> label_names;
    bool cardinality_warned{false};
    std::unordered_map<LabelKey, double, LabelKeyHash> counters;
    std::unordered_map<LabelKey, HistogramState, LabelKeyHash> histograms;

    size_t series_count() const { return counters.size() + histograms.size(); }
};

}  // namespace detail

namespace {

using detail::FamilyState;

std::string join(const std::vector<std::string>& names) {
    std::string out = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ",";
        out += names[i];
    }
    out += "]";
    return out;
}

bool isMetricNameChar(char c, bool first) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc) || c == '_' || c == ':') return true;
    return !first && std::isdigit(uc);
}

bool isLabelNameChar(char c, bool first) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc) || c == '_') return true;
    return !first && std::isdigit(uc);
}

void validateMetricName(const std::string& name) {
    bool ok = !name.empty();
    for (size_t i = 0; ok && i < name.size(); ++i) {
        ok = isMetricNameChar(name[i], i == 0);
    }
    if (!ok) {
        throw MetricsError(MetricsErrorCode::kInvalidName, "invalid metric name '" + name + "'");
    }
}

void validateLabelName(const std::string& family, const std::string& label, bool histogram) {
    bool ok = !label.empty() && label.rfind("__", 0) != 0;
    for (size_t i = 0; ok && i < label.size(); ++i) {
        ok = isLabelNameChar(label[i], i == 0);
    }
    if (!ok) {
        throw MetricsError(MetricsErrorCode::kInvalidName,
                           "invalid label name '" + label + "' for family '" + family + "'");
    }
    if (histogram && label == "le") {
        throw MetricsError(MetricsErrorCode::kInvalidName,
                           "label 'le' is reserved for histogram family '" + family + "'");
    }
}

void validateLabels(const std::string& family, const LabelSet& labels, bool histogram) {
    for (const auto& kv : labels) {
        validateLabelName(family, kv.first, histogram);
    }
}

std::vector<double> normalizeBounds(const std::string& family, std::vector<double> bounds) {
    if (!bounds.empty() && std::isinf(bounds.back()) && bounds.back() > 0) {
        bounds.pop_back();
    }
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (!std::isfinite(bounds[i])) {
            throw MetricsError(MetricsErrorCode::kInvalidBuckets,
                               "non-finite bucket bound for histogram '" + family + "'");
        }
        if (i > 0 && bounds[i] <= bounds[i - 1]) {
            throw MetricsError(MetricsErrorCode::kInvalidBuckets,
                               "bucket bounds must be strictly ascending for histogram '" + family + "'");
        }
    }
    bounds.push_back(std::numeric_limits<double>::infinity());
    return bounds;
}

// Shape and cardinality checks for a series about to be created.
// Caller holds family.mutex. Commits the family shape on success.
void admitSeries(FamilyState& family, const LabelKey& key, size_t max_series) {
    auto names = key.names();
    if (family.shape_fixed && names != family.label_names) {
        throw LabelShapeMismatchError("family '" + family.name + "' expects labels " +
                                      join(family.label_names) + ", got " + join(names));
    }
    if (max_series > 0 && family.series_count() >= max_series) {
        if (!family.cardinality_warned) {
            family.cardinality_warned = true;
            spdlog::warn("metrics: family '{}' reached the limit of {} series; new label sets are rejected",
                         family.name, max_series);
        }
        throw MetricsError(MetricsErrorCode::kCardinalityExceeded,
                           "family '" + family.name + "' already holds " +
                               std::to_string(family.series_count()) + " series");
    }
    if (!family.shape_fixed) {
        family.label_names = std::move(names);
        family.shape_fixed = true;
    }
}

std::shared_ptr<FamilyState> makeFamily(const std::string& name,
                                        const std::string& help,
                                        MetricType type,
                                        ValueFormat format,
                                        std::vector<std::string> label_names) {
    auto family = std::make_shared<FamilyState>();
    family->name = name;
    family->help = help;
    family->type = type;
    family->format = format;
    if (!label_names.empty()) {
        std::sort(label_names.begin(), label_names.end());
        if (std::adjacent_find(label_names.begin(), label_names.end()) != label_names.end()) {
            throw MetricsError(MetricsErrorCode::kInvalidName,
                               "duplicate label name for family '" + name + "'");
        }
        family->label_names = std::move(label_names);
        family->shape_fixed = true;
    }
    return family;
}

}  // namespace

const char* to_string(MetricType type) {
    switch (type) {
        case MetricType::Counter:
            return "counter";
        case MetricType::Histogram:
            return "histogram";
        case MetricType::DerivedGauge:
            return "gauge";
    }
    return "untyped";
}

const FamilySnapshot* RegistrySnapshot::find(const std::string& name) const {
    for (const auto& family : families) {
        if (family.name == name) return &family;
    }
    return nullptr;
}

MetricRegistry::MetricRegistry(RegistryOptions options) : options_(options) {}

MetricRegistry::~MetricRegistry() = default;

MetricRegistry::FamilyPtr MetricRegistry::find_family(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = families_.find(name);
    if (it == families_.end()) return nullptr;
    return it->second;
}

MetricRegistry::FamilyPtr MetricRegistry::insert_family(FamilyPtr family) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = families_.find(family->name);
    if (it != families_.end()) return it->second;
    families_.emplace(family->name, family);
    order_.push_back(family);
    return family;
}

void MetricRegistry::register_family(FamilyPtr family) {
    auto registered = insert_family(family);
    if (registered == family) {
        spdlog::debug("metrics: registered {} family '{}'", to_string(family->type), family->name);
        return;
    }

    // Re-declaration: must agree with what is already there.
    if (registered->type != family->type) {
        throw MetricsError(MetricsErrorCode::kTypeMismatch,
                           "family '" + family->name + "' is already registered as " +
                               to_string(registered->type));
    }
    if (registered->type == MetricType::Histogram && registered->bounds != family->bounds) {
        throw MetricsError(MetricsErrorCode::kTypeMismatch,
                           "histogram '" + family->name + "' is already registered with other buckets");
    }
    if (family->shape_fixed) {
        std::lock_guard<std::mutex> lock(registered->mutex);
        if (registered->shape_fixed && registered->label_names != family->label_names) {
            throw LabelShapeMismatchError("family '" + family->name + "' expects labels " +
                                          join(registered->label_names) + ", got " +
                                          join(family->label_names));
        }
        registered->label_names = family->label_names;
        registered->shape_fixed = true;
    }
}

void MetricRegistry::register_counter(const std::string& name,
                                      const std::string& help,
                                      ValueFormat format,
                                      std::vector<std::string> label_names) {
    validateMetricName(name);
    for (const auto& label : label_names) validateLabelName(name, label, false);
    register_family(makeFamily(name, help, MetricType::Counter, format, std::move(label_names)));
}

void MetricRegistry::register_histogram(const std::string& name,
                                        const std::string& help,
                                        std::vector<double> bounds,
                                        ValueFormat format,
                                        std::vector<std::string> label_names) {
    validateMetricName(name);
    for (const auto& label : label_names) validateLabelName(name, label, true);
    auto family = makeFamily(name, help, MetricType::Histogram, format, std::move(label_names));
    family->bounds = normalizeBounds(name, std::move(bounds));
    register_family(std::move(family));
}

void MetricRegistry::register_derived_gauge(const std::string& name,
                                            const std::string& help,
                                            DerivedGaugeFn derive,
                                            ValueFormat format) {
    validateMetricName(name);
    if (!derive) {
        throw std::invalid_argument("derived gauge '" + name + "' needs a derivation function");
    }
    auto family = makeFamily(name, help, MetricType::DerivedGauge, format, {});
    family->derive = std::move(derive);
    register_family(std::move(family));
}

void MetricRegistry::record_counter(const std::string& family_name, const LabelSet& labels, double delta) {
    if (!std::isfinite(delta) || delta < 0.0) {
        throw InvalidDeltaError("counter '" + family_name + "' cannot change by " + std::to_string(delta));
    }
    validateLabels(family_name, labels, false);

    auto family = find_family(family_name);
    if (!family) {
        validateMetricName(family_name);
        auto created = makeFamily(family_name, "", MetricType::Counter, ValueFormat{}, {});
        family = insert_family(created);
        if (family == created) {
            spdlog::debug("metrics: created counter family '{}' on first use", family_name);
        }
    }
    if (family->type != MetricType::Counter) {
        throw MetricsError(MetricsErrorCode::kTypeMismatch,
                           "family '" + family_name + "' is a " + to_string(family->type) + ", not a counter");
    }
    if (family->format.kind == ValueFormat::Kind::kInteger && std::floor(delta) != delta) {
        throw InvalidDeltaError("integer counter '" + family_name + "' cannot change by " +
                                std::to_string(delta));
    }

    LabelKey key(labels);
    std::lock_guard<std::mutex> lock(family->mutex);
    auto it = family->counters.find(key);
    if (it != family->counters.end()) {
        it->second += delta;
        return;
    }
    admitSeries(*family, key, options_.max_series_per_family);
    family->counters.emplace(std::move(key), delta);
}

void MetricRegistry::record_histogram_observation(const std::string& family_name,
                                                  const LabelSet& labels,
                                                  double value) {
    auto family = find_family(family_name);
    if (!family || family->type != MetricType::Histogram) {
        throw UnknownBucketsError("no bucket bounds configured for '" + family_name + "'");
    }
    if (!std::isfinite(value)) {
        throw MetricsError(MetricsErrorCode::kInvalidObservation,
                           "histogram '" + family_name + "' cannot observe a non-finite value");
    }
    validateLabels(family_name, labels, true);

    LabelKey key(labels);
    std::lock_guard<std::mutex> lock(family->mutex);
    auto it = family->histograms.find(key);
    if (it == family->histograms.end()) {
        admitSeries(*family, key, options_.max_series_per_family);
        detail::HistogramState fresh;
        fresh.bucket_counts.assign(family->bounds.size(), 0);
        it = family->histograms.emplace(std::move(key), std::move(fresh)).first;
    }

    auto& state = it->second;
    // every bucket whose upper bound is >= value
    const auto first = static_cast<size_t>(
        std::lower_bound(family->bounds.begin(), family->bounds.end(), value) - family->bounds.begin());
    for (size_t i = first; i < state.bucket_counts.size(); ++i) {
        ++state.bucket_counts[i];
    }
    state.sum += value;
    ++state.count;
}

RegistrySnapshot MetricRegistry::snapshot() const {
    std::vector<FamilyPtr> families;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        families = order_;
    }

    RegistrySnapshot snap;
    snap.families.reserve(families.size());
    for (const auto& family : families) {
        FamilySnapshot out;
        out.name = family->name;
        out.help = family->help;
        out.type = family->type;
        out.format = family->format;
        out.bounds = family->bounds;
        out.derive = family->derive;
        {
            std::lock_guard<std::mutex> lock(family->mutex);
            out.counters.reserve(family->counters.size());
            for (const auto& kv : family->counters) {
                out.counters.push_back(CounterSample{kv.first, kv.second});
            }
            out.histograms.reserve(family->histograms.size());
            for (const auto& kv : family->histograms) {
                out.histograms.push_back(
                    HistogramSample{kv.first, kv.second.bucket_counts, kv.second.sum, kv.second.count});
            }
        }
        std::sort(out.counters.begin(), out.counters.end(),
                  [](const CounterSample& a, const CounterSample& b) { return a.labels < b.labels; });
        std::sort(out.histograms.begin(), out.histograms.end(),
                  [](const HistogramSample& a, const HistogramSample& b) { return a.labels < b.labels; });
        snap.families.push_back(std::move(out));
    }
    return snap;
}

size_t MetricRegistry::family_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return order_.size();
}

}  // namespace chitty::metrics
