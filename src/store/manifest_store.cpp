#include "store/manifest_store.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/digest_stream.h"
#include "utils/prune.h"

namespace fs = std::filesystem;

namespace layerstore {

namespace {

constexpr const char* kStagingDir = ".staging";

// Create an empty, uniquely named file in dir. Returns an empty path on failure.
fs::path make_staging_file(const fs::path& dir, std::error_code& ec) {
    std::string tmpl = (dir / "manifest-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd < 0) {
        ec = std::error_code(errno, std::generic_category());
        return {};
    }
    ::close(fd);
    return fs::path(buf.data());
}

}  // namespace

ManifestStore::ManifestStore(StoreConfig config, std::shared_ptr<spdlog::logger> log)
    : config_(std::move(config)),
      log_(log ? std::move(log) : spdlog::default_logger()),
      blobs_(config_.blobsDir(), log_) {}

StoreResult<fs::path> ManifestStore::manifestsRoot() const {
    std::error_code ec;
    fs::path root = fs::absolute(config_.manifestsDir(), ec);
    if (ec) {
        return StoreResult<fs::path>::failure(StoreErrorCode::kIoError,
                                              config_.manifestsDir().string() + ": " + ec.message());
    }
    fs::create_directories(root, ec);
    if (ec) {
        log_->error("ManifestStore: cannot create manifest root {}: {}", root.string(), ec.message());
        return StoreResult<fs::path>::failure(StoreErrorCode::kIoError, root.string() + ": " + ec.message());
    }
    return StoreResult<fs::path>::success(root.lexically_normal());
}

StoreResult<Manifest> ManifestStore::parse(const Name& name) const {
    log_->debug("ManifestStore::parse: {}", name.toString());
    if (!name.isFullyQualified()) {
        return StoreResult<Manifest>::failure(StoreErrorCode::kUnqualifiedName,
                                              "name is not fully qualified: " + name.toString());
    }

    auto root = manifestsRoot();
    if (!root.ok()) {
        return StoreResult<Manifest>::failure(root.error, root.error_message);
    }
    return parseFile(*root.data / name.filepath());
}

StoreResult<Manifest> ManifestStore::parseFile(const fs::path& path) const {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        log_->debug("ManifestStore::parse: {} does not exist", path.string());
        return StoreResult<Manifest>::failure(StoreErrorCode::kNotFound, path.string() + ": no such file");
    }
    if (ec) {
        return StoreResult<Manifest>::failure(StoreErrorCode::kIoError, path.string() + ": " + ec.message());
    }
    if (fs::is_directory(status)) {
        return StoreResult<Manifest>::failure(StoreErrorCode::kIoError, path.string() + ": is a directory");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        const int err = errno;
        if (err == ENOENT) {
            return StoreResult<Manifest>::failure(StoreErrorCode::kNotFound, path.string() + ": no such file");
        }
        return StoreResult<Manifest>::failure(StoreErrorCode::kIoError,
                                              path.string() + ": " + std::strerror(err));
    }

    auto modified = fs::last_write_time(path, ec);
    if (ec) {
        return StoreResult<Manifest>::failure(StoreErrorCode::kIoError, path.string() + ": " + ec.message());
    }

    DigestingStreambuf tee(file.rdbuf());
    std::istream in(&tee);

    Manifest m;
    try {
        m = manifest_from_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        log_->debug("ManifestStore::parse: decode failed for {}: {}", path.string(), e.what());
        return StoreResult<Manifest>::failure(StoreErrorCode::kCorrupt, path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        log_->debug("ManifestStore::parse: decode failed for {}: {}", path.string(), e.what());
        return StoreResult<Manifest>::failure(StoreErrorCode::kCorrupt, path.string() + ": " + e.what());
    }

    m.digest = tee.finish();
    if (m.digest.empty()) {
        return StoreResult<Manifest>::failure(StoreErrorCode::kIoError, path.string() + ": digest failed");
    }
    m.filepath = path;
    m.modified = modified;
    m.file_size = tee.bytesRead();

    log_->debug("ManifestStore::parse: {} digest={}", path.string(), m.digest);
    return StoreResult<Manifest>::success(std::move(m));
}

StoreResult<void> ManifestStore::write(const Name& name, const Layer& config, const std::vector<Layer>& layers) const {
    log_->debug("ManifestStore::write: {}", name.toString());
    if (!name.isFullyQualified()) {
        return StoreResult<void>::failure(StoreErrorCode::kUnqualifiedName,
                                          "name is not fully qualified: " + name.toString());
    }

    auto root = manifestsRoot();
    if (!root.ok()) {
        return StoreResult<void>::failure(root.error, root.error_message);
    }

    const fs::path path = *root.data / name.filepath();
    const fs::path staging = *root.data / kStagingDir;
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (!ec) fs::create_directories(staging, ec);
    if (ec) {
        log_->error("ManifestStore::write: cannot create directories for {}: {}", path.string(), ec.message());
        return StoreResult<void>::failure(StoreErrorCode::kIoError, path.string() + ": " + ec.message());
    }

    Manifest m;
    m.schema_version = kManifestSchemaVersion;
    m.media_type = kManifestMediaType;
    m.config = config;
    m.layers = layers;

    const fs::path temp_path = make_staging_file(staging, ec);
    if (ec) {
        log_->error("ManifestStore::write: cannot create staging file in {}: {}", staging.string(), ec.message());
        return StoreResult<void>::failure(StoreErrorCode::kIoError, staging.string() + ": " + ec.message());
    }

    {
        std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
        ofs << manifest_to_json(m).dump() << '\n';
        ofs.flush();
        if (!ofs.good()) {
            std::error_code rm_ec;
            fs::remove(temp_path, rm_ec);
            log_->error("ManifestStore::write: failed writing {}", temp_path.string());
            return StoreResult<void>::failure(StoreErrorCode::kIoError, temp_path.string() + ": write failed");
        }
    }

    fs::permissions(temp_path,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                    ec);
    if (!ec) fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(temp_path, rm_ec);
        log_->error("ManifestStore::write: cannot publish {}: {}", path.string(), ec.message());
        return StoreResult<void>::failure(StoreErrorCode::kIoError, path.string() + ": " + ec.message());
    }

    log_->info("ManifestStore::write: wrote {} ({} layers)", path.string(), layers.size());
    return StoreResult<void>::success();
}

StoreResult<void> ManifestStore::remove(const Manifest& manifest) const {
    log_->debug("ManifestStore::remove: {}", manifest.filepath.string());
    std::error_code ec;
    if (!fs::remove(manifest.filepath, ec)) {
        if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
        log_->error("ManifestStore::remove: failed to delete {}: {}", manifest.filepath.string(), ec.message());
        const auto code = ec == std::errc::no_such_file_or_directory ? StoreErrorCode::kNotFound
                                                                     : StoreErrorCode::kIoError;
        return StoreResult<void>::failure(code, manifest.filepath.string() + ": " + ec.message());
    }

    auto root = manifestsRoot();
    if (!root.ok()) {
        return StoreResult<void>::failure(root.error, root.error_message);
    }

    if (auto err = prune_directory(*root.data)) {
        log_->error("ManifestStore::remove: pruning {} failed: {}", root.data->string(), err.message());
        return StoreResult<void>::failure(StoreErrorCode::kIoError, root.data->string() + ": " + err.message());
    }

    log_->info("ManifestStore::remove: deleted {}", manifest.filepath.string());
    return StoreResult<void>::success();
}

StoreResult<void> ManifestStore::removeLayers(const Manifest& manifest) const {
    log_->debug("ManifestStore::removeLayers: {}", manifest.filepath.string());

    auto refs = layerReferences(ScanPolicy::kBestEffort);
    if (!refs.ok()) {
        return StoreResult<void>::failure(refs.error, refs.error_message);
    }

    auto root = manifestsRoot();
    if (!root.ok()) {
        return StoreResult<void>::failure(root.error, root.error_message);
    }
    const fs::path self = manifest.filepath.lexically_normal();

    auto shared_elsewhere = [&](const std::string& digest) -> const Name* {
        const std::string canonical = canonical_digest(digest);
        auto it = refs.data->find(canonical.empty() ? digest : canonical);
        if (it == refs.data->end()) return nullptr;
        for (const auto& owner : it->second) {
            if ((*root.data / owner.filepath()).lexically_normal() != self) {
                return &owner;
            }
        }
        return nullptr;
    };

    for (const auto& layer : manifest.allLayers()) {
        if (layer.digest.empty()) continue;

        if (const Name* owner = shared_elsewhere(layer.digest)) {
            log_->info("ManifestStore::removeLayers: keeping {} (still used by {})",
                       layer.digest, owner->displayShortest());
            continue;
        }

        auto removed = blobs_.remove(layer.digest);
        if (removed.error == StoreErrorCode::kNotFound) {
            log_->debug("ManifestStore::removeLayers: layer does not exist: {}", layer.digest);
            continue;
        }
        if (!removed.ok()) {
            log_->error("ManifestStore::removeLayers: failed to remove {}: {}", layer.digest, removed.error_message);
            return removed;
        }
    }
    return StoreResult<void>::success();
}

}  // namespace layerstore
