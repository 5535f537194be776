// layerstore rm: delete a model (no confirmation)

#include "cli/commands.h"

namespace layerstore {
namespace cli {
namespace commands {

int rm(const RmOptions& options, const ManifestStore& store, std::ostream& out, std::ostream& err) {
    if (options.model.empty()) {
        err << "Error: model name required" << std::endl;
        return 1;
    }

    auto manifest = store.parse(Name::parse(options.model));
    if (manifest.error == StoreErrorCode::kNotFound) {
        err << "Error: model '" << options.model << "' not found" << std::endl;
        return 1;
    }
    if (!manifest.ok()) {
        err << "Error: " << manifest.error_message << std::endl;
        return 1;
    }

    // blobs go first so a failure leaves the manifest in place for a retry
    if (!options.keep_layers) {
        auto layers = store.removeLayers(*manifest.data);
        if (!layers.ok()) {
            err << "Error: " << layers.error_message << std::endl;
            return 1;
        }
    }

    auto removed = store.remove(*manifest.data);
    if (!removed.ok()) {
        err << "Error: " << removed.error_message << std::endl;
        return 1;
    }

    out << "deleted '" << options.model << "'" << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace layerstore
