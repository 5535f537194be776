// layerstore verify: re-hash every blob a model references

#include "cli/commands.h"

namespace layerstore {
namespace cli {
namespace commands {

int verify(const VerifyOptions& options, const ManifestStore& store, std::ostream& out, std::ostream& err) {
    auto manifest = store.parse(Name::parse(options.model));
    if (manifest.error == StoreErrorCode::kNotFound) {
        err << "Error: model '" << options.model << "' not found" << std::endl;
        return 1;
    }
    if (!manifest.ok()) {
        err << "Error: " << manifest.error_message << std::endl;
        return 1;
    }

    int failures = 0;
    for (const auto& layer : manifest.data->allLayers()) {
        if (layer.digest.empty()) continue;

        auto check = store.blobs().verify(layer);
        if (!check.ok()) {
            err << "Error: " << check.error_message << std::endl;
            ++failures;
            continue;
        }
        if (!check.data->present) {
            out << layer.digest << ": missing" << std::endl;
            ++failures;
        } else if (!check.data->digest_match) {
            out << layer.digest << ": digest mismatch" << std::endl;
            ++failures;
        } else if (!check.data->size_match) {
            out << layer.digest << ": size " << check.data->actual_size
                << " != " << layer.size << std::endl;
            ++failures;
        } else {
            out << layer.digest << ": ok" << std::endl;
        }
    }

    if (failures > 0) {
        err << "Error: " << failures << " layer(s) failed verification" << std::endl;
        return 1;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace layerstore
