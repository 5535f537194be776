#include "store/manifest.h"

#include <stdexcept>

namespace layerstore {

namespace {

nlohmann::ordered_json layer_to_json(const Layer& layer) {
    nlohmann::ordered_json j;
    j["mediaType"] = layer.media_type;
    j["digest"] = layer.digest;
    j["size"] = layer.size;
    return j;
}

}  // namespace

int64_t Manifest::size() const {
    int64_t total = config.size;
    for (const auto& layer : layers) {
        total += layer.size;
    }
    return total;
}

std::vector<Layer> Manifest::allLayers() const {
    std::vector<Layer> out = layers;
    out.push_back(config);
    return out;
}

nlohmann::ordered_json manifest_to_json(const Manifest& manifest) {
    nlohmann::ordered_json j;
    j["schemaVersion"] = manifest.schema_version;
    j["mediaType"] = manifest.media_type;
    j["config"] = layer_to_json(manifest.config);
    j["layers"] = nlohmann::ordered_json::array();
    for (const auto& layer : manifest.layers) {
        j["layers"].push_back(layer_to_json(layer));
    }
    return j;
}

Manifest manifest_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("manifest must be a JSON object, got " + std::string(j.type_name()));
    }
    if (!j.contains("config")) {
        throw std::invalid_argument("manifest has no config layer");
    }

    Manifest m;
    if (auto it = j.find("schemaVersion"); it != j.end() && !it->is_null()) {
        if (it->is_number() && !it->is_number_integer()) {
            throw std::invalid_argument("manifest schemaVersion must be an integer");
        }
        it->get_to(m.schema_version);
    }
    if (auto it = j.find("mediaType"); it != j.end() && !it->is_null()) {
        it->get_to(m.media_type);
    }
    j.at("config").get_to(m.config);
    // "layers": null is what older writers produced for an empty list
    if (auto it = j.find("layers"); it != j.end() && !it->is_null()) {
        it->get_to(m.layers);
    }
    return m;
}

}  // namespace layerstore
