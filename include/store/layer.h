// layer.h - content-addressed blob references and the blob directory
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "store/store_error.h"

namespace layerstore {

constexpr const char* kMediaTypeModel = "application/vnd.ollama.image.model";
constexpr const char* kMediaTypeAdapter = "application/vnd.ollama.image.adapter";
constexpr const char* kMediaTypeProjector = "application/vnd.ollama.image.projector";
constexpr const char* kMediaTypeTemplate = "application/vnd.ollama.image.template";
constexpr const char* kMediaTypeParams = "application/vnd.ollama.image.params";
constexpr const char* kMediaTypeLicense = "application/vnd.ollama.image.license";
constexpr const char* kMediaTypeConfig = "application/vnd.docker.container.image.v1+json";

/// Reference to one blob. An empty digest means the layer has no backing blob.
struct Layer {
    std::string media_type;
    std::string digest;   // "sha256:<64 hex>"
    int64_t size{0};      // trusted as written

    bool operator==(const Layer& other) const {
        return media_type == other.media_type && digest == other.digest && size == other.size;
    }
    bool operator!=(const Layer& other) const { return !(*this == other); }
};

// Missing keys keep their defaults. A non-object throws std::invalid_argument,
// a present key of the wrong type throws nlohmann::json::type_error, and a
// non-integer number for size throws std::invalid_argument.
void to_json(nlohmann::json& j, const Layer& layer);
void from_json(const nlohmann::json& j, Layer& layer);

/// "sha256:<lowercase hex>" for either accepted spelling ("sha256:<hex>" or
/// "sha256-<hex>"), "" if digest is not a sha256 digest. Equal results mean
/// the same blob file.
std::string canonical_digest(const std::string& digest);

/// Outcome of checking one blob against its layer reference.
struct BlobCheck {
    std::string digest;
    std::filesystem::path path;
    bool present{false};
    bool digest_match{false};
    bool size_match{false};
    int64_t actual_size{0};

    bool ok() const { return present && digest_match && size_match; }
};

/// Blob directory: <models>/blobs/sha256-<hex>
class BlobStore {
public:
    explicit BlobStore(std::filesystem::path blobs_dir,
                       std::shared_ptr<spdlog::logger> log = nullptr);

    /// Validate a digest ("sha256:<hex>" or "sha256-<hex>") and map it to a path.
    StoreResult<std::filesystem::path> blobPath(const std::string& digest) const;

    bool exists(const std::string& digest) const;

    /// Delete one blob. An absent blob yields kNotFound so callers can decide
    /// whether that matters.
    StoreResult<void> remove(const std::string& digest) const;

    /// Re-hash a blob and compare digest and size with the layer reference.
    StoreResult<BlobCheck> verify(const Layer& layer) const;

    const std::filesystem::path& blobsDir() const { return blobs_dir_; }

private:
    std::filesystem::path blobs_dir_;
    std::shared_ptr<spdlog::logger> log_;
};

}  // namespace layerstore
