#include "metrics/exposition_serializer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <spdlog/spdlog.h>

namespace chitty::metrics {

namespace {

std::string printFixed(double value, int decimals) {
    char buf[512];
    int n = std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    if (n < 0) return "0";
    if (static_cast<size_t>(n) < sizeof(buf)) return std::string(buf, static_cast<size_t>(n));
    // Very large magnitudes; retry with an exact-size buffer.
    std::string out(static_cast<size_t>(n) + 1, '\0');
    std::snprintf(out.data(), out.size(), "%.*f", decimals, value);
    out.resize(static_cast<size_t>(n));
    return out;
}

// Shortest fixed-point text that parses back to `value`. No exponent form.
std::string shortestDecimal(double value) {
    if (value == 0.0) return "0";
    int start = 0;
    const double magnitude = std::floor(std::log10(std::fabs(value)));
    // log10 may land one off near powers of ten
    if (magnitude < -1) start = static_cast<int>(-magnitude) - 1;
    for (int decimals = start; decimals <= start + 17; ++decimals) {
        std::string text = printFixed(value, decimals);
        if (std::strtod(text.c_str(), nullptr) == value) return text;
    }
    return printFixed(value, start + 17);
}

const char* nonFinite(double value) {
    if (std::isnan(value)) return "NaN";
    return value > 0 ? "+Inf" : "-Inf";
}

void writeLabels(std::string& out,
                 const LabelKey& labels,
                 const char* extra_name = nullptr,
                 const std::string& extra_value = {}) {
    if (labels.empty() && extra_name == nullptr) return;
    out += '{';
    bool first = true;
    for (const auto& p : labels.pairs()) {
        if (!first) out += ',';
        first = false;
        out += p.first;
        out += "=\"";
        out += escape_label_value(p.second);
        out += '"';
    }
    if (extra_name != nullptr) {
        if (!first) out += ',';
        out += extra_name;
        out += "=\"";
        out += extra_value;
        out += '"';
    }
    out += '}';
}

void writeSample(std::string& out,
                 const std::string& name,
                 const char* suffix,
                 const LabelKey& labels,
                 const std::string& value,
                 const char* extra_name = nullptr,
                 const std::string& extra_value = {}) {
    out += name;
    out += suffix;
    writeLabels(out, labels, extra_name, extra_value);
    out += ' ';
    out += value;
    out += '\n';
}

void writeHeader(std::string& out, const FamilySnapshot& family) {
    out += "# HELP ";
    out += family.name;
    if (!family.help.empty()) {
        out += ' ';
        out += escape_help(family.help);
    }
    out += "\n# TYPE ";
    out += family.name;
    out += ' ';
    out += to_string(family.type);
    out += '\n';
}

std::string formatCount(uint64_t count) {
    return std::to_string(count);
}

void renderHistogram(std::string& out, const FamilySnapshot& family) {
    std::vector<std::string> bound_labels;
    bound_labels.reserve(family.bounds.size());
    for (double bound : family.bounds) bound_labels.push_back(format_bound(bound));

    for (const auto& series : family.histograms) {
        for (size_t i = 0; i < family.bounds.size() && i < series.bucket_counts.size(); ++i) {
            writeSample(out, family.name, "_bucket", series.labels,
                        formatCount(series.bucket_counts[i]), "le", bound_labels[i]);
        }
        writeSample(out, family.name, "_sum", series.labels, format_value(series.sum, family.format));
        writeSample(out, family.name, "_count", series.labels, formatCount(series.count));
    }
}

void renderDerived(std::string& out, const FamilySnapshot& family, const RegistrySnapshot& snapshot) {
    if (!family.derive) return;
    std::vector<GaugeSample> samples;
    try {
        samples = family.derive(snapshot);
    } catch (const std::exception& e) {
        spdlog::warn("metrics: derived gauge '{}' failed: {}", family.name, e.what());
        return;
    } catch (...) {
        spdlog::warn("metrics: derived gauge '{}' failed with a non-standard exception", family.name);
        return;
    }
    std::sort(samples.begin(), samples.end(),
              [](const GaugeSample& a, const GaugeSample& b) { return a.labels < b.labels; });
    for (const auto& sample : samples) {
        writeSample(out, family.name, "", sample.labels, format_value(sample.value, family.format));
    }
}

}  // namespace

std::string escape_label_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 4);
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            default:   out += c;
        }
    }
    return out;
}

std::string unescape_label_value(const std::string& escaped) {
    std::string out;
    out.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); ++i) {
        char c = escaped[i];
        if (c != '\\' || i + 1 == escaped.size()) {
            out += c;
            continue;
        }
        char next = escaped[++i];
        switch (next) {
            case '\\': out += '\\'; break;
            case '"':  out += '"';  break;
            case 'n':  out += '\n'; break;
            default:
                // unknown escape, keep as written
                out += '\\';
                out += next;
        }
    }
    return out;
}

std::string escape_help(const std::string& help) {
    std::string out;
    out.reserve(help.size());
    for (char c : help) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    return out;
}

std::string format_value(double value, const ValueFormat& format) {
    if (!std::isfinite(value)) return nonFinite(value);
    if (value == 0.0) value = 0.0;  // drop the sign of -0
    switch (format.kind) {
        case ValueFormat::Kind::kInteger:
            return printFixed(value, 0);
        case ValueFormat::Kind::kFixed:
            return printFixed(value, format.precision < 0 ? 0 : format.precision);
        case ValueFormat::Kind::kFixedOrZero:
            if (value == 0.0) return "0";
            return printFixed(value, format.precision < 0 ? 0 : format.precision);
        case ValueFormat::Kind::kAuto:
            break;
    }
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        return printFixed(value, 0);
    }
    return shortestDecimal(value);
}

std::string format_bound(double bound) {
    if (!std::isfinite(bound)) return nonFinite(bound);
    std::string text = shortestDecimal(bound);
    if (text.find('.') == std::string::npos) text += ".0";
    return text;
}

std::string ExpositionSerializer::render(const RegistrySnapshot& snapshot) const {
    std::string out;
    for (const auto& family : snapshot.families) {
        writeHeader(out, family);
        switch (family.type) {
            case MetricType::Counter:
                for (const auto& series : family.counters) {
                    writeSample(out, family.name, "", series.labels, format_value(series.value, family.format));
                }
                break;
            case MetricType::Histogram:
                renderHistogram(out, family);
                break;
            case MetricType::DerivedGauge:
                renderDerived(out, family, snapshot);
                break;
        }
    }
    return out;
}

}  // namespace chitty::metrics
