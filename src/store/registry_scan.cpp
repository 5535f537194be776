// Bulk enumeration of the manifest root.
#include "store/manifest_store.h"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace layerstore {

namespace {

// One path segment per name part: host/namespace/model/tag.
constexpr int kNameDepth = 4;

// Sorted entries exactly `depth` levels below dir. Intermediate levels must be
// directories; unreadable directories are skipped.
void collect_candidates(const fs::path& dir, int depth, std::vector<fs::path>& out) {
    std::error_code ec;
    std::vector<fs::path> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        if (depth == 1) {
            out.push_back(entry);
            continue;
        }
        std::error_code st_ec;
        if (fs::is_directory(entry, st_ec)) {
            collect_candidates(entry, depth - 1, out);
        }
    }
}

}  // namespace

StoreResult<ManifestMap> ManifestStore::listAll(ScanPolicy policy) const {
    auto root = manifestsRoot();
    if (!root.ok()) {
        return StoreResult<ManifestMap>::failure(root.error, root.error_message);
    }

    std::vector<fs::path> matches;
    collect_candidates(*root.data, kNameDepth, matches);
    log_->debug("ManifestStore::listAll: {} candidates under {}", matches.size(), root.data->string());

    const bool strict = policy == ScanPolicy::kStrict;
    ManifestMap out;

    for (const auto& match : matches) {
        std::error_code ec;
        auto status = fs::status(match, ec);
        if (ec) {
            if (strict) {
                return StoreResult<ManifestMap>::failure(StoreErrorCode::kIoError,
                                                         match.string() + ": " + ec.message());
            }
            log_->warn("bad manifest file path={} error={}", match.string(), ec.message());
            continue;
        }
        if (fs::is_directory(status)) continue;

        const fs::path rel = match.lexically_relative(*root.data);
        if (rel.empty() || rel.is_absolute()) {
            if (strict) {
                return StoreResult<ManifestMap>::failure(StoreErrorCode::kIoError,
                                                         match.string() + ": not below " + root.data->string());
            }
            log_->warn("bad filepath path={}", match.string());
            continue;
        }

        Name name = Name::fromFilepath(rel.generic_string());
        if (!name.isValid()) {
            if (strict) {
                return StoreResult<ManifestMap>::failure(StoreErrorCode::kInvalidName,
                                                         rel.generic_string() + ": invalid manifest name");
            }
            log_->warn("bad manifest name path={}", rel.generic_string());
            continue;
        }

        auto parsed = parse(name);
        if (!parsed.ok()) {
            if (strict) {
                return StoreResult<ManifestMap>::failure(parsed.error,
                                                         name.toString() + " " + parsed.error_message);
            }
            log_->warn("bad manifest name={} error={}", name.toString(), parsed.error_message);
            continue;
        }

        // a later path resolving to the same name replaces the earlier one
        out.insert_or_assign(name, std::move(*parsed.data));
    }

    log_->debug("ManifestStore::listAll: {} valid manifests", out.size());
    return StoreResult<ManifestMap>::success(std::move(out));
}

StoreResult<LayerReferences> ManifestStore::layerReferences(ScanPolicy policy) const {
    auto manifests = listAll(policy);
    if (!manifests.ok()) {
        return StoreResult<LayerReferences>::failure(manifests.error, manifests.error_message);
    }

    LayerReferences refs;
    for (const auto& [name, manifest] : *manifests.data) {
        for (const auto& layer : manifest.allLayers()) {
            if (layer.digest.empty()) continue;
            const std::string canonical = canonical_digest(layer.digest);
            auto& owners = refs[canonical.empty() ? layer.digest : canonical];
            if (std::find(owners.begin(), owners.end(), name) == owners.end()) {
                owners.push_back(name);
            }
        }
    }
    return StoreResult<LayerReferences>::success(std::move(refs));
}

}  // namespace layerstore
