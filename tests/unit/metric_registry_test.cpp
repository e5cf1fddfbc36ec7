#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <limits>
#include <thread>
#include <vector>

#include "metrics/metric_errors.h"
#include "metrics/metric_registry.h"

using namespace chitty::metrics;

namespace {
double counterValue(const RegistrySnapshot& snap, const std::string& family, const LabelSet& labels) {
    const auto* f = snap.find(family);
    if (!f) return -1.0;
    LabelKey key(labels);
    for (const auto& s : f->counters) {
        if (s.labels == key) return s.value;
    }
    return -1.0;
}

MetricsErrorCode codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const MetricsError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected MetricsError";
    return MetricsErrorCode::kInvalidDelta;
}
}  // namespace

TEST(MetricRegistryTest, CounterIsCreatedOnFirstUse) {
    MetricRegistry registry;
    registry.record_counter("requests_total", {{"model", "gpt-4"}});
    registry.record_counter("requests_total", {{"model", "gpt-4"}}, 2);

    auto snap = registry.snapshot();
    ASSERT_EQ(snap.families.size(), 1u);
    EXPECT_EQ(snap.families[0].type, MetricType::Counter);
    EXPECT_TRUE(snap.families[0].help.empty());
    EXPECT_DOUBLE_EQ(counterValue(snap, "requests_total", {{"model", "gpt-4"}}), 3.0);
}

TEST(MetricRegistryTest, ConcurrentIncrementsAreNotLost) {
    MetricRegistry registry;
    std::vector<std::thread> workers;
    for (int t = 0; t < 10; ++t) {
        workers.emplace_back([&registry]() {
            for (int i = 0; i < 100; ++i) {
                registry.record_counter("requests_total", {{"model", "gpt-4"}, {"tenant", "t1"}}, 1);
            }
        });
    }
    for (auto& w : workers) w.join();

    auto snap = registry.snapshot();
    EXPECT_DOUBLE_EQ(counterValue(snap, "requests_total", {{"model", "gpt-4"}, {"tenant", "t1"}}), 1000.0);
}

TEST(MetricRegistryTest, ConcurrentRecordAndSnapshot) {
    MetricRegistry registry;
    registry.register_histogram("latency_seconds", "Latency", {0.1, 1.0});

    std::thread writer([&registry]() {
        for (int i = 0; i < 2000; ++i) {
            registry.record_counter("requests_total", {{"model", "m" + std::to_string(i % 5)}});
            registry.record_histogram_observation("latency_seconds", {}, 0.05 * (i % 30));
        }
    });
    for (int i = 0; i < 50; ++i) {
        auto snap = registry.snapshot();
        const auto* h = snap.find("latency_seconds");
        ASSERT_NE(h, nullptr);
        for (const auto& series : h->histograms) {
            ASSERT_EQ(series.bucket_counts.size(), 3u);
            EXPECT_LE(series.bucket_counts[0], series.bucket_counts[1]);
            EXPECT_LE(series.bucket_counts[1], series.bucket_counts[2]);
            EXPECT_EQ(series.bucket_counts.back(), series.count);
        }
    }
    writer.join();
}

TEST(MetricRegistryTest, HistogramBucketsAreCumulative) {
    MetricRegistry registry;
    registry.register_histogram("latency_seconds", "Request latency", {0.01, 0.1, 0.5});
    registry.record_histogram_observation("latency_seconds", {{"model", "gpt-4"}}, 0.03);

    auto snap = registry.snapshot();
    const auto* family = snap.find("latency_seconds");
    ASSERT_NE(family, nullptr);
    ASSERT_EQ(family->bounds.size(), 4u);
    EXPECT_TRUE(std::isinf(family->bounds.back()));
    ASSERT_EQ(family->histograms.size(), 1u);
    const auto& series = family->histograms[0];
    EXPECT_EQ(series.bucket_counts, (std::vector<uint64_t>{0, 1, 1, 1}));
    EXPECT_DOUBLE_EQ(series.sum, 0.03);
    EXPECT_EQ(series.count, 1u);
}

TEST(MetricRegistryTest, ObservationOnBoundCountsInThatBucket) {
    MetricRegistry registry;
    registry.register_histogram("latency_seconds", "", {0.1, 1.0});
    registry.record_histogram_observation("latency_seconds", {}, 0.1);
    registry.record_histogram_observation("latency_seconds", {}, 50.0);

    auto snap = registry.snapshot();
    const auto& series = snap.find("latency_seconds")->histograms.at(0);
    EXPECT_EQ(series.bucket_counts, (std::vector<uint64_t>{1, 1, 2}));
    EXPECT_EQ(series.count, 2u);
}

TEST(MetricRegistryTest, NegativeDeltaIsRejectedWithoutMutation) {
    MetricRegistry registry;
    registry.record_counter("requests_total", {{"model", "gpt-4"}}, 5);

    EXPECT_THROW(registry.record_counter("requests_total", {{"model", "gpt-4"}}, -1), InvalidDeltaError);
    EXPECT_THROW(registry.record_counter("requests_total", {{"model", "gpt-4"}},
                                         std::numeric_limits<double>::quiet_NaN()),
                 InvalidDeltaError);

    auto snap = registry.snapshot();
    EXPECT_DOUBLE_EQ(counterValue(snap, "requests_total", {{"model", "gpt-4"}}), 5.0);
}

TEST(MetricRegistryTest, ZeroDeltaCreatesSeries) {
    MetricRegistry registry;
    registry.record_counter("cache_requests_total", {{"model", "gpt-4"}}, 0);
    auto snap = registry.snapshot();
    EXPECT_DOUBLE_EQ(counterValue(snap, "cache_requests_total", {{"model", "gpt-4"}}), 0.0);
}

TEST(MetricRegistryTest, LabelShapeMismatchIsRejected) {
    MetricRegistry registry;
    registry.record_counter("requests_total", {{"model", "gpt-4"}, {"tenant", "t1"}});

    EXPECT_THROW(registry.record_counter("requests_total", {{"model", "gpt-4"}}), LabelShapeMismatchError);
    EXPECT_THROW(registry.record_counter("requests_total", {{"model", "gpt-4"}, {"region", "eu"}}),
                 LabelShapeMismatchError);

    auto snap = registry.snapshot();
    EXPECT_EQ(snap.find("requests_total")->counters.size(), 1u);
}

TEST(MetricRegistryTest, DeclaredLabelNamesFixTheShape) {
    MetricRegistry registry;
    registry.register_counter("requests_total", "Requests", ValueFormat::integer(), {"tenant", "model"});

    EXPECT_THROW(registry.record_counter("requests_total", {{"model", "gpt-4"}}), LabelShapeMismatchError);
    EXPECT_NO_THROW(registry.record_counter("requests_total", {{"model", "gpt-4"}, {"tenant", "t1"}}));
}

TEST(MetricRegistryTest, UnregisteredHistogramIsRejected) {
    MetricRegistry registry;
    EXPECT_THROW(registry.record_histogram_observation("latency_seconds", {}, 0.2), UnknownBucketsError);
    EXPECT_EQ(registry.family_count(), 0u);

    registry.record_counter("requests_total", {});
    EXPECT_THROW(registry.record_histogram_observation("requests_total", {}, 0.2), UnknownBucketsError);
}

TEST(MetricRegistryTest, NonFiniteObservationIsRejected) {
    MetricRegistry registry;
    registry.register_histogram("latency_seconds", "", {1.0});
    EXPECT_EQ(codeOf([&] {
                  registry.record_histogram_observation("latency_seconds", {},
                                                        std::numeric_limits<double>::infinity());
              }),
              MetricsErrorCode::kInvalidObservation);
    EXPECT_TRUE(registry.snapshot().find("latency_seconds")->histograms.empty());
}

TEST(MetricRegistryTest, TypeMismatchOnReRegistration) {
    MetricRegistry registry;
    registry.register_counter("requests_total", "Requests");

    EXPECT_EQ(codeOf([&] { registry.register_histogram("requests_total", "", {1.0}); }),
              MetricsErrorCode::kTypeMismatch);

    registry.register_histogram("latency_seconds", "", {0.1, 1.0});
    EXPECT_EQ(codeOf([&] { registry.register_histogram("latency_seconds", "", {0.5}); }),
              MetricsErrorCode::kTypeMismatch);
    EXPECT_NO_THROW(registry.register_histogram("latency_seconds", "", {0.1, 1.0}));

    EXPECT_EQ(codeOf([&] { registry.record_counter("latency_seconds", {}); }),
              MetricsErrorCode::kTypeMismatch);
}

TEST(MetricRegistryTest, ReRegistrationKeepsFirstHelp) {
    MetricRegistry registry;
    registry.register_counter("requests_total", "first");
    registry.register_counter("requests_total", "second");
    auto snap = registry.snapshot();
    ASSERT_EQ(snap.families.size(), 1u);
    EXPECT_EQ(snap.families[0].help, "first");
}

TEST(MetricRegistryTest, InvalidNamesAreRejected) {
    MetricRegistry registry;
    EXPECT_EQ(codeOf([&] { registry.record_counter("1requests", {}); }), MetricsErrorCode::kInvalidName);
    EXPECT_EQ(codeOf([&] { registry.record_counter("requests-total", {}); }), MetricsErrorCode::kInvalidName);
    EXPECT_EQ(codeOf([&] { registry.record_counter("requests_total", {{"bad-label", "x"}}); }),
              MetricsErrorCode::kInvalidName);
    EXPECT_EQ(codeOf([&] { registry.record_counter("requests_total", {{"__reserved", "x"}}); }),
              MetricsErrorCode::kInvalidName);
    EXPECT_EQ(codeOf([&] { registry.register_histogram("latency_seconds", "", {1.0}, {}, {"le"}); }),
              MetricsErrorCode::kInvalidName);
    EXPECT_EQ(codeOf([&] { registry.register_counter("dup_total", "", {}, {"model", "model"}); }),
              MetricsErrorCode::kInvalidName);
    EXPECT_EQ(registry.family_count(), 0u);
}

TEST(MetricRegistryTest, InvalidBucketsAreRejected) {
    MetricRegistry registry;
    EXPECT_EQ(codeOf([&] { registry.register_histogram("h1", "", {1.0, 0.5}); }),
              MetricsErrorCode::kInvalidBuckets);
    EXPECT_EQ(codeOf([&] { registry.register_histogram("h2", "", {1.0, 1.0}); }),
              MetricsErrorCode::kInvalidBuckets);
    EXPECT_EQ(codeOf([&] {
                  registry.register_histogram("h3", "", {std::numeric_limits<double>::quiet_NaN()});
              }),
              MetricsErrorCode::kInvalidBuckets);
    EXPECT_EQ(registry.family_count(), 0u);
}

TEST(MetricRegistryTest, ExplicitInfBoundIsNotDuplicated) {
    MetricRegistry registry;
    registry.register_histogram("latency_seconds", "", {0.5, std::numeric_limits<double>::infinity()});
    EXPECT_EQ(registry.snapshot().find("latency_seconds")->bounds.size(), 2u);
}

TEST(MetricRegistryTest, EmptyBoundsLeaveOnlyInfBucket) {
    MetricRegistry registry;
    registry.register_histogram("latency_seconds", "", {});
    registry.record_histogram_observation("latency_seconds", {}, 3.0);
    const auto& series = registry.snapshot().find("latency_seconds")->histograms.at(0);
    EXPECT_EQ(series.bucket_counts, (std::vector<uint64_t>{1}));
}

TEST(MetricRegistryTest, IntegerCounterRejectsFractionalDelta) {
    MetricRegistry registry;
    registry.register_counter("requests_total", "", ValueFormat::integer());
    EXPECT_THROW(registry.record_counter("requests_total", {}, 0.5), InvalidDeltaError);
    EXPECT_NO_THROW(registry.record_counter("requests_total", {}, 2));
}

TEST(MetricRegistryTest, CardinalityCapRejectsNewSeries) {
    RegistryOptions options;
    options.max_series_per_family = 2;
    MetricRegistry registry(options);

    registry.record_counter("requests_total", {{"tenant", "a"}});
    registry.record_counter("requests_total", {{"tenant", "b"}});
    EXPECT_EQ(codeOf([&] { registry.record_counter("requests_total", {{"tenant", "c"}}); }),
              MetricsErrorCode::kCardinalityExceeded);
    // existing series keep accumulating
    EXPECT_NO_THROW(registry.record_counter("requests_total", {{"tenant", "a"}}));

    auto snap = registry.snapshot();
    EXPECT_EQ(snap.find("requests_total")->counters.size(), 2u);
    EXPECT_DOUBLE_EQ(counterValue(snap, "requests_total", {{"tenant", "a"}}), 2.0);
}

TEST(MetricRegistryTest, SnapshotKeepsRegistrationOrderAndSortsSeries) {
    MetricRegistry registry;
    registry.register_counter("zeta_total", "");
    registry.register_counter("alpha_total", "");
    registry.record_counter("alpha_total", {{"model", "b"}});
    registry.record_counter("alpha_total", {{"model", "a"}});

    auto snap = registry.snapshot();
    ASSERT_EQ(snap.families.size(), 2u);
    EXPECT_EQ(snap.families[0].name, "zeta_total");
    EXPECT_EQ(snap.families[1].name, "alpha_total");
    ASSERT_EQ(snap.families[1].counters.size(), 2u);
    EXPECT_EQ(snap.families[1].counters[0].labels.pairs()[0].second, "a");
    EXPECT_EQ(snap.families[1].counters[1].labels.pairs()[0].second, "b");
}

TEST(MetricRegistryTest, SnapshotIsIndependentOfLaterWrites) {
    MetricRegistry registry;
    registry.record_counter("requests_total", {}, 1);
    auto before = registry.snapshot();
    registry.record_counter("requests_total", {}, 1);

    EXPECT_DOUBLE_EQ(counterValue(before, "requests_total", {}), 1.0);
    EXPECT_DOUBLE_EQ(counterValue(registry.snapshot(), "requests_total", {}), 2.0);
}

TEST(MetricRegistryTest, DerivedGaugeNeedsFunction) {
    MetricRegistry registry;
    EXPECT_THROW(registry.register_derived_gauge("ratio", "", DerivedGaugeFn{}), std::invalid_argument);
}

TEST(MetricRegistryTest, ErrorMessagesCarryCodeName) {
    MetricRegistry registry;
    try {
        registry.record_counter("requests_total", {}, -2);
        FAIL() << "expected InvalidDeltaError";
    } catch (const InvalidDeltaError& e) {
        EXPECT_EQ(e.code(), MetricsErrorCode::kInvalidDelta);
        EXPECT_EQ(std::string(e.what()).rfind("INVALID_DELTA: ", 0), 0u);
    }
    EXPECT_STREQ(to_string(MetricsErrorCode::kLabelShapeMismatch), "LABEL_SHAPE_MISMATCH");
    EXPECT_STREQ(to_string(MetricType::DerivedGauge), "gauge");
}
