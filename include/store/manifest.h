// manifest.h - on-disk description of one named model package
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "store/layer.h"

namespace layerstore {

constexpr int kManifestSchemaVersion = 2;
constexpr const char* kManifestMediaType = "application/vnd.docker.distribution.manifest.v2+json";

struct Manifest {
    // Serialized fields. Any schemaVersion/mediaType is accepted on read.
    int schema_version{0};
    std::string media_type;
    Layer config;
    std::vector<Layer> layers;

    // Filled in by ManifestStore::parse, never serialized.
    std::filesystem::path filepath;           // absolute path it was read from
    std::filesystem::file_time_type modified{};
    uintmax_t file_size{0};
    std::string digest;                       // sha256 hex of the file bytes

    // Sum of config and layer sizes as recorded in the manifest.
    int64_t size() const;

    // Content layers followed by the config layer.
    std::vector<Layer> allLayers() const;
};

// Document form with keys in schemaVersion, mediaType, config, layers order.
nlohmann::ordered_json manifest_to_json(const Manifest& manifest);

// Throws nlohmann::json::exception or std::invalid_argument on shape errors.
Manifest manifest_from_json(const nlohmann::json& j);

}  // namespace layerstore
