#include "utils/cli.h"
#include "utils/version.h"

#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace chitty {

namespace {

bool isNumber(const char* text) {
    if (!text || !*text) return false;
    for (const char* p = text; *p; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
    }
    return true;
}

CliResult usageError(const std::string& message) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "error: " + message + "\n\n" + getHelpMessage();
    return result;
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "chitty-exporter " << CHITTY_VERSION << " - Prometheus metrics exporter for the chitty gateway\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    chitty-exporter [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>          Listen port (default: 9090, or CHITTY_PORT)\n";
    oss << "    --host <HOST>          Bind address (default: 0.0.0.0)\n";
    oss << "    --sample-data [N]      Record N synthetic requests before serving (default: 1000)\n";
    oss << "    --log-level <LEVEL>    Log level (trace|debug|info|warn|error)\n";
    oss << "    -h, --help             Print help information\n";
    oss << "    -V, --version          Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    CHITTY_PORT                   HTTP server port (default: 9090)\n";
    oss << "    CHITTY_BIND_ADDRESS           Bind address\n";
    oss << "    CHITTY_METRICS_PATH           Scrape path (default: /metrics)\n";
    oss << "    CHITTY_HEALTH_PATH            Health path (default: /health)\n";
    oss << "    CHITTY_GZIP                   Compress responses for gzip clients (default: true)\n";
    oss << "    CHITTY_MAX_SERIES_PER_FAMILY  Series cap per metric family (default: 0, unlimited)\n";
    oss << "    CHITTY_CONFIG                 Config file path (default: ~/.chittycan/exporter.json)\n";
    oss << "    CHITTY_LOG_LEVEL              Log level (trace|debug|info|warn|error)\n";
    oss << "    CHITTY_LOG_DIR                Log directory (file logging is off when unset)\n";
    oss << "    CHITTY_LOG_RETENTION_DAYS     Log retention days (default: 7)\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "chitty-exporter " << CHITTY_VERSION << "\n";
    return oss.str();
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getHelpMessage();
            return result;
        }

        if (std::strcmp(arg, "-V") == 0 || std::strcmp(arg, "--version") == 0) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getVersionMessage();
            return result;
        }

        if (std::strcmp(arg, "--port") == 0) {
            if (i + 1 >= argc) return usageError("--port requires a value");
            const char* value = argv[++i];
            if (!isNumber(value)) return usageError(std::string("invalid port '") + value + "'");
            int port = 0;
            try {
                port = std::stoi(value);
            } catch (const std::exception&) {
                return usageError(std::string("invalid port '") + value + "'");
            }
            if (port < 1 || port > 65535) {
                return usageError(std::string("port out of range '") + value + "'");
            }
            result.options.port = static_cast<uint16_t>(port);
            result.options.port_set = true;
        } else if (std::strcmp(arg, "--host") == 0) {
            if (i + 1 >= argc) return usageError("--host requires a value");
            result.options.host = argv[++i];
            result.options.host_set = true;
        } else if (std::strcmp(arg, "--sample-data") == 0) {
            result.options.sample_data = true;
            // the count is optional
            if (i + 1 < argc && isNumber(argv[i + 1])) {
                try {
                    result.options.sample_count = static_cast<size_t>(std::stoull(argv[++i]));
                } catch (const std::exception&) {
                    return usageError(std::string("invalid sample count '") + argv[i] + "'");
                }
            }
        } else if (std::strcmp(arg, "--log-level") == 0) {
            if (i + 1 >= argc) return usageError("--log-level requires a value");
            result.options.log_level = argv[++i];
        } else {
            return usageError(std::string("unknown option '") + arg + "'");
        }
    }

    return result;
}

}  // namespace chitty
