// layerstore show: manifest details for one model

#include "cli/commands.h"
#include <iomanip>

namespace layerstore {
namespace cli {
namespace commands {

int show(const ShowOptions& options, const ManifestStore& store, std::ostream& out, std::ostream& err) {
    if (options.model.empty()) {
        err << "Error: model name required" << std::endl;
        return 1;
    }

    const Name name = Name::parse(options.model);
    auto result = store.parse(name);
    if (result.error == StoreErrorCode::kNotFound) {
        err << "Error: model '" << options.model << "' not found" << std::endl;
        return 1;
    }
    if (!result.ok()) {
        err << "Error: " << result.error_message << std::endl;
        return 1;
    }

    const Manifest& m = *result.data;
    if (options.json) {
        out << manifest_to_json(m).dump(2) << std::endl;
        return 0;
    }

    out << "Name: " << name.toString() << std::endl;
    out << "Digest: sha256:" << m.digest << std::endl;
    out << "Schema: " << m.schema_version << " (" << m.media_type << ")" << std::endl;
    out << "Size: " << m.size() << " bytes" << std::endl;
    out << "Manifest: " << m.filepath.string() << std::endl;
    out << std::endl;
    out << std::left
        << std::setw(48) << "MEDIA TYPE"
        << std::setw(20) << "DIGEST"
        << std::setw(12) << "SIZE"
        << std::endl;
    for (const auto& layer : m.allLayers()) {
        const std::string id = layer.digest.size() > 7 ? layer.digest.substr(7, 12) : layer.digest;
        out << std::left
            << std::setw(48) << layer.media_type
            << std::setw(20) << id
            << std::setw(12) << formatSize(static_cast<uint64_t>(layer.size))
            << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace layerstore
