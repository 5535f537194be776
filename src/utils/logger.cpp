#include "utils/logger.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace layerstore::logger {

namespace {
    constexpr const char* LOG_FILE_BASE = "layerstore.jsonl";
    constexpr const char* DEFAULT_DATA_DIR = ".layerstore";
    constexpr const char* LOG_SUBDIR = "logs";
    constexpr int DEFAULT_RETENTION_DAYS = 7;

    constexpr const char* LOG_DIR_ENV = "LAYERSTORE_LOG_DIR";
    constexpr const char* LOG_LEVEL_ENV = "LAYERSTORE_LOG_LEVEL";
    constexpr const char* LOG_RETENTION_DAYS_ENV = "LAYERSTORE_LOG_RETENTION_DAYS";

    std::string format_date(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d");
        return oss.str();
    }

    std::string get_home_dir() {
        if (const char* home = std::getenv("HOME")) {
            return home;
        }
        return "/tmp";
    }
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (const char* env = std::getenv(LOG_DIR_ENV)) {
        return env;
    }
    return (fs::path(get_home_dir()) / DEFAULT_DATA_DIR / LOG_SUBDIR).string();
}

std::string get_log_file_path() {
    std::string filename = std::string(LOG_FILE_BASE) + "." + format_date(std::chrono::system_clock::now());
    return (fs::path(get_log_dir()) / filename).string();
}

int get_retention_days() {
    if (const char* env = std::getenv(LOG_RETENTION_DAYS_ENV)) {
        try {
            int days = std::stoi(env);
            if (days > 0 && days < 365) {
                return days;
            }
        } catch (const std::exception&) {
            // fall through to the default
        }
    }
    return DEFAULT_RETENTION_DAYS;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::exists(log_dir, ec)) {
        return;
    }

    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);
    const std::string cutoff_str = format_date(cutoff);
    const std::string prefix = std::string(LOG_FILE_BASE) + ".";

    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;

        std::string filename = it->path().filename().string();
        if (filename.rfind(prefix, 0) != 0) continue;

        // dates are zero-padded, so string order is date order
        if (filename.substr(prefix.length()) < cutoff_str) {
            std::error_code rm_ec;
            fs::remove(it->path(), rm_ec);
        }
    }
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level) {
    auto log = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    log->set_level(level);
    return log;
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);

    if (!file_path.empty() && sinks.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }

    if (sinks.empty()) {
        std::string default_path = get_log_file_path();
        fs::create_directories(fs::path(default_path).parent_path());
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(default_path, false));
    }

    auto log = std::make_shared<spdlog::logger>("layerstore", sinks.begin(), sinks.end());
    spdlog::set_default_logger(log);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_from_env() {
    std::string level = "warn";
    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        level = env;
    }

    std::string log_dir = get_log_dir();
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
    sinks.push_back(console_sink);

    std::error_code ec;
    fs::create_directories(log_dir, ec);
    std::string log_path;
    if (!ec) {
        cleanup_old_logs(log_dir, get_retention_days());
        log_path = get_log_file_path();
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
            file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex&) {
            log_path.clear();
        }
    }

    // Preserve per-sink patterns (console human-readable, file JSON).
    init(level, "", "", sinks);

    if (log_path.empty()) {
        spdlog::warn("File logging disabled: cannot write to {}", log_dir);
    } else {
        spdlog::debug("Logs initialized: {}", log_path);
    }
}

}  // namespace layerstore::logger
