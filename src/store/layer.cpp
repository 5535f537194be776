#include "store/layer.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

#include "utils/sha256.h"

namespace fs = std::filesystem;

namespace layerstore {

namespace {

constexpr size_t kSha256HexLength = 64;

template <typename T>
void get_if_present(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    it->get_to(out);
}

// nlohmann converts floats to integers silently; a fractional or huge size is
// a type mismatch here.
void get_integer_if_present(const nlohmann::json& j, const char* key, int64_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (it->is_number() && !it->is_number_integer()) {
        throw std::invalid_argument(std::string("layer ") + key + " must be an integer");
    }
    it->get_to(out);
}

bool is_hex(const std::string& s) {
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

}  // namespace

void to_json(nlohmann::json& j, const Layer& layer) {
    j = nlohmann::json{
        {"mediaType", layer.media_type},
        {"digest", layer.digest},
        {"size", layer.size},
    };
}

void from_json(const nlohmann::json& j, Layer& layer) {
    if (!j.is_object()) {
        throw std::invalid_argument("layer must be an object, got " + std::string(j.type_name()));
    }
    get_if_present(j, "mediaType", layer.media_type);
    get_if_present(j, "digest", layer.digest);
    get_integer_if_present(j, "size", layer.size);
}

std::string canonical_digest(const std::string& digest) {
    // sha256:<hex> and sha256-<hex> name the same blob
    const std::string prefix = "sha256";
    if (digest.size() != prefix.size() + 1 + kSha256HexLength ||
        digest.compare(0, prefix.size(), prefix) != 0 ||
        (digest[prefix.size()] != ':' && digest[prefix.size()] != '-')) {
        return "";
    }
    std::string hex = digest.substr(prefix.size() + 1);
    if (!is_hex(hex)) return "";
    std::transform(hex.begin(), hex.end(), hex.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return prefix + ":" + hex;
}

BlobStore::BlobStore(fs::path blobs_dir, std::shared_ptr<spdlog::logger> log)
    : blobs_dir_(std::move(blobs_dir)), log_(log ? std::move(log) : spdlog::default_logger()) {}

StoreResult<fs::path> BlobStore::blobPath(const std::string& digest) const {
    const std::string canonical = canonical_digest(digest);
    if (canonical.empty()) {
        return StoreResult<fs::path>::failure(StoreErrorCode::kInvalidDigest,
                                              "invalid digest format: " + digest);
    }
    // files use the dash form
    return StoreResult<fs::path>::success(blobs_dir_ / ("sha256-" + canonical.substr(7)));
}

bool BlobStore::exists(const std::string& digest) const {
    auto path = blobPath(digest);
    if (!path.ok()) return false;
    std::error_code ec;
    return fs::is_regular_file(*path.data, ec);
}

StoreResult<void> BlobStore::remove(const std::string& digest) const {
    auto path = blobPath(digest);
    if (!path.ok()) {
        return StoreResult<void>::failure(path.error, path.error_message);
    }

    std::error_code ec;
    const bool removed = fs::remove(*path.data, ec);
    if (ec) {
        log_->error("BlobStore::remove: failed to delete {}: {}", path.data->string(), ec.message());
        return StoreResult<void>::failure(StoreErrorCode::kIoError,
                                          path.data->string() + ": " + ec.message());
    }
    if (!removed) {
        return StoreResult<void>::failure(StoreErrorCode::kNotFound,
                                          path.data->string() + ": no such file");
    }
    log_->debug("BlobStore::remove: deleted {}", path.data->string());
    return StoreResult<void>::success();
}

StoreResult<BlobCheck> BlobStore::verify(const Layer& layer) const {
    auto path = blobPath(layer.digest);
    if (!path.ok()) {
        return StoreResult<BlobCheck>::failure(path.error, path.error_message);
    }

    BlobCheck check;
    check.digest = layer.digest;
    check.path = *path.data;

    std::error_code ec;
    if (!fs::is_regular_file(check.path, ec)) {
        return StoreResult<BlobCheck>::success(std::move(check));
    }
    check.present = true;

    auto size = fs::file_size(check.path, ec);
    if (ec) {
        return StoreResult<BlobCheck>::failure(StoreErrorCode::kIoError,
                                               check.path.string() + ": " + ec.message());
    }
    check.actual_size = static_cast<int64_t>(size);
    check.size_match = check.actual_size == layer.size;

    const std::string actual = sha256_file(check.path);
    if (actual.empty()) {
        return StoreResult<BlobCheck>::failure(StoreErrorCode::kIoError,
                                               check.path.string() + ": failed to read blob");
    }
    check.digest_match = actual == canonical_digest(layer.digest).substr(7);

    if (!check.ok()) {
        log_->warn("BlobStore::verify: {} digest_match={} size={} expected={}",
                   layer.digest, check.digest_match, check.actual_size, layer.size);
    }
    return StoreResult<BlobCheck>::success(std::move(check));
}

}  // namespace layerstore
