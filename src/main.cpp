#include <chrono>
#include <iostream>
#include <signal.h>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "api/http_server.h"
#include "api/metrics_endpoints.h"
#include "metrics/gateway_metrics.h"
#include "metrics/metric_registry.h"
#include "metrics/sample_data.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

std::string displayHost(const std::string& bind_address) {
    if (bind_address.empty() || bind_address == "0.0.0.0" || bind_address == "::") {
        return "localhost";
    }
    return bind_address;
}

void printStartupBanner(const chitty::ExporterConfig& cfg) {
    const std::string base = "http://" + displayHost(cfg.bind_address) + ":" + std::to_string(cfg.port);
    std::cout << "Metrics: " << base << cfg.metrics_path << std::endl;
    std::cout << "Health:  " << base << cfg.health_path << std::endl;
    std::cout << std::endl;
    std::cout << "Add to prometheus.yml:" << std::endl;
    std::cout << "  scrape_configs:" << std::endl;
    std::cout << "    - job_name: 'chitty'" << std::endl;
    std::cout << "      metrics_path: '" << cfg.metrics_path << "'" << std::endl;
    std::cout << "      static_configs:" << std::endl;
    std::cout << "        - targets: ['" << displayHost(cfg.bind_address) << ":" << cfg.port << "']"
              << std::endl;
    std::cout << std::endl;
}

int run_exporter(const chitty::ExporterConfig& cfg, const chitty::ExporterOptions& options) {
    chitty::g_running_flag.store(true);

    try {
        chitty::metrics::RegistryOptions registry_options;
        registry_options.max_series_per_family = cfg.max_series_per_family;
        chitty::metrics::MetricRegistry registry(registry_options);

        chitty::metrics::GatewayMetricsOptions gateway_options;
        gateway_options.duration_buckets = cfg.duration_buckets;
        chitty::metrics::GatewayMetrics gateway(registry, gateway_options);

        if (options.sample_data) {
            chitty::metrics::generate_sample_data(gateway, options.sample_count);
        }

        chitty::MetricsEndpoints endpoints(registry, cfg.metrics_path, cfg.health_path);
        chitty::HttpServer server(cfg.port, endpoints, cfg.bind_address);
        server.enableCompression(cfg.gzip_enabled);

        spdlog::info("Starting HTTP server on {}:{}", cfg.bind_address, cfg.port);
        server.start();
        printStartupBanner(cfg);

        while (chitty::is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down...");
        server.stop();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    spdlog::info("Exporter shutdown complete");
    return 0;
}

void signalHandler(int) {
    chitty::request_shutdown();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto cli_result = chitty::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }
    const auto& options = cli_result.options;

    try {
        chitty::logger::init_from_env(options.log_level);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return 1;
    }
    spdlog::info("chitty-exporter v{} starting...", CHITTY_VERSION);

    auto [cfg, config_log] = chitty::loadExporterConfigWithLog();
    spdlog::info("Config: {}", config_log);
    if (options.port_set) {
        cfg.port = options.port;
    }
    if (options.host_set) {
        cfg.bind_address = options.host;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    return run_exporter(cfg, options);
}
