// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace chitty::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory from CHITTY_LOG_DIR; empty when file logging is off.
std::string get_log_dir();

// Today's log file inside `log_dir` (chitty-exporter.jsonl.YYYY-MM-DD).
std::string get_log_file_path(const std::string& log_dir);

// Retention days from CHITTY_LOG_RETENTION_DAYS (default: 7).
int get_retention_days();

// Remove chitty-exporter.jsonl.* files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Initialize default logger. Without sinks and file_path, logs go to stdout.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize using environment variables:
// CHITTY_LOG_LEVEL (trace|debug|info|warn|error|critical|off)
// CHITTY_LOG_DIR (enables the JSONL file sink)
// CHITTY_LOG_RETENTION_DAYS (default: 7)
// `level_override` (e.g. from --log-level) wins over CHITTY_LOG_LEVEL.
void init_from_env(const std::string& level_override = "");

}  // namespace chitty::logger
