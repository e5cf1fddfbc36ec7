// exposition_serializer.h - Prometheus text format (0.0.4) writer
#pragma once

#include <string>

#include "metrics/metric_registry.h"

namespace chitty::metrics {

/// Content-Type of a scrape response.
inline constexpr const char* kExpositionContentType = "text/plain; version=0.0.4";

class ExpositionSerializer {
public:
    /// Renders every family of `snapshot` in registration order.
    /// Derived gauges are evaluated here. Never throws on a snapshot the
    /// registry can produce; the output depends only on the snapshot.
    std::string render(const RegistrySnapshot& snapshot) const;
};

// Label value escaping: backslash, double quote and newline.
std::string escape_label_value(const std::string& value);
std::string unescape_label_value(const std::string& escaped);

// HELP text escaping: backslash and newline.
std::string escape_help(const std::string& help);

std::string format_value(double value, const ValueFormat& format);

// `le` label value; +Inf for the sentinel, integral bounds keep ".0".
std::string format_bound(double bound);

}  // namespace chitty::metrics
