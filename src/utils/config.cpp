#include "utils/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace chitty {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::optional<bool> parseBool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return std::nullopt;
}

bool validPort(long long port) {
    return port > 0 && port <= 65535;
}

bool validPath(const std::string& path) {
    // "/:" would be read as a route parameter
    return !path.empty() && path.front() == '/' && path.find("/:") == std::string::npos;
}

// Whole-string integer; trailing characters are an error.
long long parseInteger(const std::string& text) {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("trailing characters in '" + text + "'");
    }
    return value;
}

std::filesystem::path defaultConfigPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path();
    return home / ".chittycan/exporter.json";
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        spdlog::warn("Ignoring malformed config file {}", path.string());
        return false;
    }
    return true;
}

void applyJson(const nlohmann::json& j, ExporterConfig& cfg) {
    if (j.contains("port") && j["port"].is_number_integer()) {
        auto port = j["port"].get<long long>();
        if (validPort(port)) cfg.port = static_cast<int>(port);
    }
    if (j.contains("bind_address") && j["bind_address"].is_string()) {
        cfg.bind_address = j["bind_address"].get<std::string>();
    }
    if (j.contains("metrics_path") && j["metrics_path"].is_string()) {
        auto path = j["metrics_path"].get<std::string>();
        if (validPath(path)) cfg.metrics_path = path;
    }
    if (j.contains("health_path") && j["health_path"].is_string()) {
        auto path = j["health_path"].get<std::string>();
        if (validPath(path)) cfg.health_path = path;
    }
    if (j.contains("gzip") && j["gzip"].is_boolean()) {
        cfg.gzip_enabled = j["gzip"].get<bool>();
    }
    if (j.contains("duration_buckets") && j["duration_buckets"].is_array()) {
        std::vector<double> buckets;
        for (const auto& item : j["duration_buckets"]) {
            if (!item.is_number()) {
                buckets.clear();
                break;
            }
            buckets.push_back(item.get<double>());
        }
        // the registry validates ordering when the histogram is declared
        if (!buckets.empty()) cfg.duration_buckets = std::move(buckets);
    }
    if (j.contains("max_series_per_family") && j["max_series_per_family"].is_number_unsigned()) {
        cfg.max_series_per_family = j["max_series_per_family"].get<size_t>();
    }
}

}  // namespace

std::pair<ExporterConfig, std::string> loadExporterConfigWithLog() {
    ExporterConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    // file
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("CHITTY_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }
    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            applyJson(j, cfg);
            log << "file=" << cfg_path.string() << " ";
            used_file = true;
        }
    }

    // env overrides
    if (auto v = getEnvValue("CHITTY_PORT")) {
        try {
            long long port = parseInteger(*v);
            if (!validPort(port)) throw std::out_of_range("port");
            cfg.port = static_cast<int>(port);
            log << "env:PORT=" << cfg.port << " ";
            used_env = true;
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid CHITTY_PORT '{}'", *v);
        }
    }
    if (auto v = getEnvValue("CHITTY_BIND_ADDRESS")) {
        if (!v->empty()) {
            cfg.bind_address = *v;
            log << "env:BIND_ADDRESS=" << *v << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CHITTY_METRICS_PATH")) {
        if (validPath(*v)) {
            cfg.metrics_path = *v;
            log << "env:METRICS_PATH=" << *v << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid CHITTY_METRICS_PATH '{}'", *v);
        }
    }
    if (auto v = getEnvValue("CHITTY_HEALTH_PATH")) {
        if (validPath(*v)) {
            cfg.health_path = *v;
            log << "env:HEALTH_PATH=" << *v << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid CHITTY_HEALTH_PATH '{}'", *v);
        }
    }
    if (auto v = getEnvValue("CHITTY_GZIP")) {
        if (auto flag = parseBool(*v)) {
            cfg.gzip_enabled = *flag;
            log << "env:GZIP=" << (*flag ? "true" : "false") << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid CHITTY_GZIP '{}'", *v);
        }
    }
    if (auto v = getEnvValue("CHITTY_MAX_SERIES_PER_FAMILY")) {
        try {
            long long n = parseInteger(*v);
            if (n < 0) throw std::out_of_range("max series");
            cfg.max_series_per_family = static_cast<size_t>(n);
            log << "env:MAX_SERIES_PER_FAMILY=" << n << " ";
            used_env = true;
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid CHITTY_MAX_SERIES_PER_FAMILY '{}'", *v);
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

ExporterConfig loadExporterConfig() {
    return loadExporterConfigWithLog().first;
}

}  // namespace chitty
