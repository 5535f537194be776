#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>
#include <fstream>

#include <spdlog/sinks/ostream_sink.h>

#include "utils/logger.h"
#include "../test_utils.h"

namespace fs = std::filesystem;
using layerstore::test::TempDir;
using layerstore::test::EnvGuard;

namespace {
std::string format_date(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

void touch_file(const fs::path& path) {
    std::ofstream ofs(path);
    ofs << "log";
}
}  // namespace

TEST(LoggerRotationTest, RemovesLogsOlderThanRetention) {
    TempDir temp("log-rotation");

    auto now = std::chrono::system_clock::now();
    fs::path old_file = temp.path / ("layerstore.jsonl." + format_date(now - std::chrono::hours(24 * 10)));
    fs::path recent_file = temp.path / ("layerstore.jsonl." + format_date(now - std::chrono::hours(24)));
    fs::path unrelated = temp.path / "other.log";
    touch_file(old_file);
    touch_file(recent_file);
    touch_file(unrelated);

    layerstore::logger::cleanup_old_logs(temp.path.string(), 3);

    EXPECT_FALSE(fs::exists(old_file));
    EXPECT_TRUE(fs::exists(recent_file));
    EXPECT_TRUE(fs::exists(unrelated));
}

TEST(LoggerRotationTest, RetentionDaysFromEnv) {
    EnvGuard guard({"LAYERSTORE_LOG_RETENTION_DAYS"});
    unsetenv("LAYERSTORE_LOG_RETENTION_DAYS");
    EXPECT_EQ(layerstore::logger::get_retention_days(), 7);
    setenv("LAYERSTORE_LOG_RETENTION_DAYS", "14", 1);
    EXPECT_EQ(layerstore::logger::get_retention_days(), 14);
    setenv("LAYERSTORE_LOG_RETENTION_DAYS", "abc", 1);
    EXPECT_EQ(layerstore::logger::get_retention_days(), 7);
    setenv("LAYERSTORE_LOG_RETENTION_DAYS", "500", 1);
    EXPECT_EQ(layerstore::logger::get_retention_days(), 7);
}

TEST(LoggerTest, ParseLevel) {
    using layerstore::logger::parse_level;
    EXPECT_EQ(parse_level("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_level("fatal"), spdlog::level::critical);
    EXPECT_EQ(parse_level("nonsense"), spdlog::level::info);
}

TEST(LoggerTest, LogFilePathUsesLogDir) {
    EnvGuard guard({"LAYERSTORE_LOG_DIR"});
    setenv("LAYERSTORE_LOG_DIR", "/var/log/layerstore", 1);
    const std::string path = layerstore::logger::get_log_file_path();
    EXPECT_EQ(path.rfind("/var/log/layerstore/layerstore.jsonl.", 0), 0u);
}

TEST(LoggerTest, InitInstallsDefaultLogger) {
    auto previous = spdlog::default_logger();
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    layerstore::logger::init("debug", "%l %v", "", {sink});

    spdlog::debug("hello {}", 42);
    spdlog::default_logger()->flush();
    EXPECT_NE(oss.str().find("debug hello 42"), std::string::npos);

    spdlog::set_default_logger(previous);
}

TEST(LoggerTest, MakeLoggerDoesNotReplaceDefault) {
    auto previous = spdlog::default_logger();
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto log = layerstore::logger::make_logger("private", {sink}, spdlog::level::warn);

    log->info("dropped");
    log->warn("kept");
    EXPECT_EQ(oss.str().find("dropped"), std::string::npos);
    EXPECT_NE(oss.str().find("kept"), std::string::npos);
    EXPECT_EQ(spdlog::default_logger(), previous);
}
