#include "utils/config.h"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>
#include "utils/file_lock.h"

namespace layerstore {

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

/// Get environment variable with fallback to deprecated name
/// Logs a warning if the deprecated name is used
std::optional<std::string> getEnvWithFallback(const char* new_name, const char* old_name) {
    if (auto v = getEnvValue(new_name)) {
        return v;
    }
    if (auto v = getEnvValue(old_name)) {
        spdlog::warn("Environment variable '{}' is deprecated, use '{}' instead", old_name, new_name);
        return v;
    }
    return std::nullopt;
}

std::filesystem::path defaultDataDir() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path(".layerstore");
    return home / ".layerstore";
}

bool readJsonWithLock(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    FileLock lock(path);
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded()) {
        spdlog::warn("Ignoring malformed config file: {}", path.string());
        return false;
    }
    return true;
}

}  // namespace

std::pair<StoreConfig, std::string> loadStoreConfigWithLog() {
    StoreConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    cfg.models_dir = (defaultDataDir() / "models").string();

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("LAYERSTORE_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultDataDir() / "config.json";
    }

    nlohmann::json j;
    if (readJsonWithLock(cfg_path, j)) {
        if (j.contains("models_dir") && j["models_dir"].is_string()) {
            cfg.models_dir = j["models_dir"].get<std::string>();
        }
        log << "file=" << cfg_path.string() << " ";
        used_file = true;
    }

    if (auto v = getEnvWithFallback("LAYERSTORE_MODELS", "OLLAMA_MODELS")) {
        if (!v->empty()) {
            cfg.models_dir = *v;
            log << "env:MODELS=" << *v << " ";
            used_env = true;
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

StoreConfig loadStoreConfig() {
    auto info = loadStoreConfigWithLog();
    return info.first;
}

}  // namespace layerstore
