// manifest_store.h - named manifests under <models>/manifests
//
// Layout:
//   <models>/manifests/<host>/<namespace>/<model>/<tag>   manifest JSON
//   <models>/blobs/sha256-<hex>                           layer blobs
//
// All operations are synchronous and take no in-process locks. Writes are
// published by rename, so a concurrent parse sees either the old or the new
// document, never a partial one.
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "store/layer.h"
#include "store/manifest.h"
#include "store/name.h"
#include "store/store_error.h"
#include "utils/config.h"

namespace layerstore {

/// How listAll() treats a candidate that cannot be turned into a manifest.
enum class ScanPolicy {
    kStrict,      // first bad candidate fails the whole scan
    kBestEffort,  // bad candidates are logged and skipped
};

using ManifestMap = std::map<Name, Manifest>;

/// Blob digest (canonical_digest form) -> names of the manifests referencing it.
using LayerReferences = std::map<std::string, std::vector<Name>>;

class ManifestStore {
public:
    /// @param config storage location (models_dir)
    /// @param log    logger for progress and skip reports; defaults to spdlog's default logger
    explicit ManifestStore(StoreConfig config, std::shared_ptr<spdlog::logger> log = nullptr);

    /// Absolute manifest root, created if missing.
    StoreResult<std::filesystem::path> manifestsRoot() const;

    /// Read the manifest stored for a fully qualified name.
    /// kUnqualifiedName before any filesystem access, kNotFound if absent,
    /// kCorrupt if the file is not a manifest document.
    StoreResult<Manifest> parse(const Name& name) const;

    /// Write (or replace) the manifest for name with schema version 2.
    StoreResult<void> write(const Name& name, const Layer& config, const std::vector<Layer>& layers) const;

    /// Delete the manifest file, then prune empty directories below the root.
    StoreResult<void> remove(const Manifest& manifest) const;

    /// Delete the blobs of every layer of manifest, except blobs still
    /// referenced by another manifest. Missing blobs are not an error.
    StoreResult<void> removeLayers(const Manifest& manifest) const;

    /// Every manifest under the root, keyed by name.
    StoreResult<ManifestMap> listAll(ScanPolicy policy) const;

    /// Which manifests reference which blobs (dry run for removeLayers).
    StoreResult<LayerReferences> layerReferences(ScanPolicy policy) const;

    const BlobStore& blobs() const { return blobs_; }
    const StoreConfig& config() const { return config_; }

private:
    StoreResult<Manifest> parseFile(const std::filesystem::path& path) const;

    StoreConfig config_;
    std::shared_ptr<spdlog::logger> log_;
    BlobStore blobs_;
};

}  // namespace layerstore
