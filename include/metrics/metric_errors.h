#pragma once

#include <stdexcept>
#include <string>

namespace chitty::metrics {

enum class MetricsErrorCode : int {
    kInvalidDelta = 1,
    kLabelShapeMismatch = 2,
    kUnknownBuckets = 3,
    kTypeMismatch = 4,
    kInvalidName = 5,
    kInvalidBuckets = 6,
    kInvalidObservation = 7,
    kCardinalityExceeded = 8,
};

inline const char* to_string(MetricsErrorCode code) {
    switch (code) {
        case MetricsErrorCode::kInvalidDelta:
            return "INVALID_DELTA";
        case MetricsErrorCode::kLabelShapeMismatch:
            return "LABEL_SHAPE_MISMATCH";
        case MetricsErrorCode::kUnknownBuckets:
            return "UNKNOWN_BUCKETS";
        case MetricsErrorCode::kTypeMismatch:
            return "TYPE_MISMATCH";
        case MetricsErrorCode::kInvalidName:
            return "INVALID_NAME";
        case MetricsErrorCode::kInvalidBuckets:
            return "INVALID_BUCKETS";
        case MetricsErrorCode::kInvalidObservation:
            return "INVALID_OBSERVATION";
        case MetricsErrorCode::kCardinalityExceeded:
            return "CARDINALITY_EXCEEDED";
    }
    return "UNKNOWN";
}

/// Raised synchronously by MetricRegistry; the registry is left untouched.
class MetricsError : public std::runtime_error {
public:
    MetricsError(MetricsErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message), code_(code) {}

    MetricsErrorCode code() const { return code_; }

private:
    MetricsErrorCode code_;
};

class InvalidDeltaError : public MetricsError {
public:
    explicit InvalidDeltaError(const std::string& message)
        : MetricsError(MetricsErrorCode::kInvalidDelta, message) {}
};

class LabelShapeMismatchError : public MetricsError {
public:
    explicit LabelShapeMismatchError(const std::string& message)
        : MetricsError(MetricsErrorCode::kLabelShapeMismatch, message) {}
};

class UnknownBucketsError : public MetricsError {
public:
    explicit UnknownBucketsError(const std::string& message)
        : MetricsError(MetricsErrorCode::kUnknownBuckets, message) {}
};

}  // namespace chitty::metrics
