#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "store/manifest.h"

using namespace layerstore;

TEST(ManifestTest, SizeSumsConfigAndLayers) {
    Manifest m;
    m.config = Layer{kMediaTypeConfig, "sha256:" + std::string(64, 'a'), 10};
    m.layers = {
        Layer{kMediaTypeModel, "sha256:" + std::string(64, 'b'), 4096},
        Layer{kMediaTypeTemplate, "sha256:" + std::string(64, 'c'), 100},
    };
    EXPECT_EQ(m.size(), 4206);
}

TEST(ManifestTest, SizeWithNoLayersIsConfigSize) {
    Manifest m;
    m.config.size = 42;
    EXPECT_EQ(m.size(), 42);
}

TEST(ManifestTest, AllLayersEndsWithConfig) {
    Manifest m;
    m.config.digest = "cfg";
    m.layers = {Layer{"", "one", 1}, Layer{"", "two", 2}};
    auto all = m.allLayers();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].digest, "one");
    EXPECT_EQ(all[1].digest, "two");
    EXPECT_EQ(all[2].digest, "cfg");
}

TEST(ManifestTest, JsonKeepsFieldOrder) {
    Manifest m;
    m.schema_version = kManifestSchemaVersion;
    m.media_type = kManifestMediaType;
    m.config = Layer{kMediaTypeConfig, "sha256:x", 1};
    const std::string dumped = manifest_to_json(m).dump();
    EXPECT_LT(dumped.find("schemaVersion"), dumped.find("mediaType"));
    EXPECT_LT(dumped.find("\"config\""), dumped.find("\"layers\":[]"));
}

TEST(ManifestTest, FromJsonToleratesHistoricalValues) {
    auto m = manifest_from_json(nlohmann::json::parse(R"({
        "schemaVersion": 1,
        "mediaType": "application/vnd.oci.image.manifest.v1+json",
        "config": {"mediaType": "c", "digest": "", "size": 0},
        "layers": null
    })"));
    EXPECT_EQ(m.schema_version, 1);
    EXPECT_EQ(m.media_type, "application/vnd.oci.image.manifest.v1+json");
    EXPECT_TRUE(m.layers.empty());
}

TEST(ManifestTest, FromJsonRejectsShapeErrors) {
    EXPECT_THROW(manifest_from_json(nlohmann::json::parse("[]")), std::invalid_argument);
    EXPECT_THROW(manifest_from_json(nlohmann::json::parse(R"({"config": {"size": 1.5}})")),
                 std::invalid_argument);
    EXPECT_THROW(manifest_from_json(nlohmann::json::parse(R"({"config": {}, "schemaVersion": 2.0})")),
                 std::invalid_argument);
    EXPECT_THROW(manifest_from_json(nlohmann::json::parse(R"({"layers": []})")), std::invalid_argument);
    EXPECT_THROW(manifest_from_json(nlohmann::json::parse(R"({"config": {}, "layers": {}})")),
                 nlohmann::json::exception);
    EXPECT_THROW(manifest_from_json(nlohmann::json::parse(R"({"config": {}, "schemaVersion": "2"})")),
                 nlohmann::json::type_error);
}
