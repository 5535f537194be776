// logger.h - spdlog setup for the store and its command line tool
#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <vector>

namespace layerstore::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory: LAYERSTORE_LOG_DIR, default ~/.layerstore/logs.
std::string get_log_dir();

// Today's log file path (layerstore.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// LAYERSTORE_LOG_RETENTION_DAYS (1..364), default 7.
int get_retention_days();

// Remove layerstore.jsonl.* files dated before now - retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Build a named logger over the given sinks without touching the default
// logger. Used to hand a private logger to a store instance.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level = spdlog::level::info);

// Initialize default logger with optional pattern and file sink.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize from LAYERSTORE_LOG_LEVEL / LAYERSTORE_LOG_DIR /
// LAYERSTORE_LOG_RETENTION_DAYS. Console output goes to stderr so command
// output on stdout stays machine readable.
void init_from_env();

}  // namespace layerstore::logger
