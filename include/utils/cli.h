#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace chitty {

/// Options for the exporter process
struct ExporterOptions {
    uint16_t port{9090};
    bool port_set{false};       // --port given; overrides config
    std::string host{"0.0.0.0"};
    bool host_set{false};       // --host given; overrides config
    bool sample_data{false};
    size_t sample_count{1000};  // --sample-data [N]
    std::string log_level;      // empty = CHITTY_LOG_LEVEL or info
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    ExporterOptions options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

}  // namespace chitty
