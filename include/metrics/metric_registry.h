#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "metrics/label_key.h"

namespace chitty::metrics {

enum class MetricType {
    Counter,
    Histogram,
    DerivedGauge,
};

/// Name used on the `# TYPE` line.
const char* to_string(MetricType type);

/// How sample values of a family are written out.
struct ValueFormat {
    enum class Kind { kAuto, kInteger, kFixed, kFixedOrZero };

    Kind kind{Kind::kAuto};
    int precision{0};

    static ValueFormat automatic() { return ValueFormat{}; }
    static ValueFormat integer() { return ValueFormat{Kind::kInteger, 0}; }
    static ValueFormat fixed(int precision) { return ValueFormat{Kind::kFixed, precision}; }
    /// Like fixed(), but an exact zero renders as "0".
    static ValueFormat fixed_or_zero(int precision) { return ValueFormat{Kind::kFixedOrZero, precision}; }

    bool operator==(const ValueFormat& other) const {
        return kind == other.kind && precision == other.precision;
    }
    bool operator!=(const ValueFormat& other) const { return !(*this == other); }
};

struct CounterSample {
    LabelKey labels;
    double value{0.0};
};

struct HistogramSample {
    LabelKey labels;
    std::vector<uint64_t> bucket_counts;  // cumulative, parallel to FamilySnapshot::bounds
    double sum{0.0};
    uint64_t count{0};
};

struct GaugeSample {
    LabelKey labels;
    double value{0.0};
};

struct RegistrySnapshot;

namespace detail {
struct FamilyState;
}

/// Computes a derived gauge from a snapshot. Must not keep state between calls.
using DerivedGaugeFn = std::function<std::vector<GaugeSample>(const RegistrySnapshot&)>;

struct FamilySnapshot {
    std::string name;
    std::string help;
    MetricType type{MetricType::Counter};
    ValueFormat format;
    std::vector<double> bounds;  // histogram only, last entry is +Inf
    std::vector<CounterSample> counters;      // sorted by labels
    std::vector<HistogramSample> histograms;  // sorted by labels
    DerivedGaugeFn derive;                    // derived gauge only
};

/// Point-in-time copy of every family, in registration order.
struct RegistrySnapshot {
    std::vector<FamilySnapshot> families;

    const FamilySnapshot* find(const std::string& name) const;
};

struct RegistryOptions {
    // 0 = no limit on distinct label sets per family
    size_t max_series_per_family{0};
};

/// Owns all metric families of the process.
///
/// Recording calls may come from any thread. Each call touches exactly one
/// series and is applied under that family's lock, so a snapshot never sees a
/// half-applied update. Counter families are created on first use; histogram
/// families must be registered with their bucket bounds first.
///
/// All validation errors are thrown as MetricsError (see metric_errors.h)
/// before anything is modified.
class MetricRegistry {
public:
    explicit MetricRegistry(RegistryOptions options = {});
    ~MetricRegistry();

    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    void register_counter(const std::string& name,
                          const std::string& help,
                          ValueFormat format = {},
                          std::vector<std::string> label_names = {});

    /// `bounds` must be finite and strictly ascending; +Inf is appended.
    void register_histogram(const std::string& name,
                            const std::string& help,
                            std::vector<double> bounds,
                            ValueFormat format = {},
                            std::vector<std::string> label_names = {});

    void register_derived_gauge(const std::string& name,
                                const std::string& help,
                                DerivedGaugeFn derive,
                                ValueFormat format = {});

    void record_counter(const std::string& family_name, const LabelSet& labels, double delta = 1.0);

    void record_histogram_observation(const std::string& family_name,
                                      const LabelSet& labels,
                                      double value);

    RegistrySnapshot snapshot() const;

    size_t family_count() const;
    const RegistryOptions& options() const { return options_; }

private:
    using FamilyPtr = std::shared_ptr<detail::FamilyState>;

    FamilyPtr find_family(const std::string& name) const;
    // Inserts `family` unless the name is taken; returns whichever is registered.
    FamilyPtr insert_family(FamilyPtr family);
    void register_family(FamilyPtr family);

    RegistryOptions options_;
    mutable std::shared_mutex mutex_;
    std::vector<FamilyPtr> order_;
    std::unordered_map<std::string, FamilyPtr> families_;
};

}  // namespace chitty::metrics
