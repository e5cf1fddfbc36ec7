#include "api/metrics_endpoints.h"

#include <cstring>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace chitty {

std::string toRoutePattern(const std::string& path) {
    // httplib switches to path-parameter matching on "/:"
    if (path.find("/:") != std::string::npos) {
        throw std::invalid_argument("route path must not contain '/:': " + path);
    }
    std::string pattern;
    pattern.reserve(path.size() * 2);
    for (char c : path) {
        if (c != '\0' && std::strchr(".^$|()[]{}*+?\\", c) != nullptr) {
            pattern += '\\';
        }
        pattern += c;
    }
    return pattern;
}

MetricsEndpoints::MetricsEndpoints(metrics::MetricRegistry& registry,
                                   std::string metrics_path,
                                   std::string health_path)
    : registry_(registry),
      metrics_path_(std::move(metrics_path)),
      health_path_(std::move(health_path)) {}

void MetricsEndpoints::registerRoutes(httplib::Server& server) {
    server.Get(toRoutePattern(metrics_path_), [this](const httplib::Request&, httplib::Response& res) {
        auto snapshot = registry_.snapshot();
        res.set_content(serializer_.render(snapshot), metrics::kExpositionContentType);
    });

    server.Get(toRoutePattern(health_path_), [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    });

    spdlog::debug("Registered routes {} and {}", metrics_path_, health_path_);
}

}  // namespace chitty
