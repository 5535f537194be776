#pragma once

#include <filesystem>
#include <string>
#include <utility>

namespace layerstore {

struct StoreConfig {
    std::string models_dir;

    std::filesystem::path manifestsDir() const { return std::filesystem::path(models_dir) / "manifests"; }
    std::filesystem::path blobsDir() const { return std::filesystem::path(models_dir) / "blobs"; }
};

// Sources, lowest priority first:
//   default      ~/.layerstore/models
//   file         $LAYERSTORE_CONFIG or ~/.layerstore/config.json ("models_dir")
//   env          LAYERSTORE_MODELS (deprecated: OLLAMA_MODELS)
StoreConfig loadStoreConfig();
std::pair<StoreConfig, std::string> loadStoreConfigWithLog();

}  // namespace layerstore
