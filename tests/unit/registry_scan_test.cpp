#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include <spdlog/sinks/ostream_sink.h>

#include "store/manifest_store.h"
#include "utils/logger.h"
#include "../test_utils.h"

using namespace layerstore;
namespace fs = std::filesystem;

class RegistryScanTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_stream);
        sink->set_pattern("[%l] %v");
        auto log = logger::make_logger("scan-test", {sink}, spdlog::level::debug);
        config.models_dir = temp.path.string();
        store = std::make_unique<ManifestStore>(config, log);
    }

    fs::path root() const { return temp.path / "manifests"; }

    void writeGood(const std::string& name) {
        auto layer = test::write_blob(temp.path, "blob for " + name);
        ASSERT_TRUE(store->write(Name::parse(name), Layer{}, {layer}).ok());
    }

    test::TempDir temp{"registry-scan"};
    std::ostringstream log_stream;
    StoreConfig config;
    std::unique_ptr<ManifestStore> store;
};

TEST_F(RegistryScanTest, EmptyRootYieldsEmptyMap) {
    auto result = store->listAll(ScanPolicy::kStrict);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.data->empty());
    EXPECT_TRUE(fs::is_directory(root()));
}

TEST_F(RegistryScanTest, ListsEveryManifestByName) {
    writeGood("registry.example/library/llama:7b");
    writeGood("registry.example/library/llama:13b");
    writeGood("mistral");

    auto result = store->listAll(ScanPolicy::kStrict);
    ASSERT_TRUE(result.ok()) << result.error_message;
    ASSERT_EQ(result.data->size(), 3u);
    EXPECT_EQ(result.data->count(Name::parse("registry.example/library/llama:7b")), 1u);
    EXPECT_EQ(result.data->count(Name::parse("registry.example/library/llama:13b")), 1u);
    EXPECT_EQ(result.data->count(Name::parse("mistral:latest")), 1u);

    const auto& m = result.data->at(Name::parse("mistral"));
    EXPECT_FALSE(m.digest.empty());
    EXPECT_EQ(m.layers.size(), 1u);
}

TEST_F(RegistryScanTest, IgnoresEntriesAtOtherDepths) {
    writeGood("registry.example/library/llama:7b");
    test::write_file(root() / "stray.json", "{}");
    test::write_file(root() / "registry.example" / "library" / "notes.txt", "x");
    test::write_file(root() / "a" / "b" / "c" / "d" / "e", "{}");

    auto result = store->listAll(ScanPolicy::kStrict);
    ASSERT_TRUE(result.ok()) << result.error_message;
    EXPECT_EQ(result.data->size(), 1u);
}

TEST_F(RegistryScanTest, StrictScanFailsOnCorruptManifest) {
    writeGood("registry.example/library/llama:7b");
    writeGood("registry.example/library/llama:13b");
    test::write_file(root() / "registry.example" / "library" / "llama" / "broken", "{not json");

    auto result = store->listAll(ScanPolicy::kStrict);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, StoreErrorCode::kCorrupt);
    EXPECT_FALSE(result.data.has_value());
    EXPECT_NE(result.error_message.find("broken"), std::string::npos);
}

TEST_F(RegistryScanTest, BestEffortScanSkipsCorruptManifest) {
    writeGood("registry.example/library/llama:7b");
    writeGood("registry.example/library/llama:13b");
    writeGood("mistral");
    test::write_file(root() / "registry.example" / "library" / "llama" / "broken", "{not json");

    auto result = store->listAll(ScanPolicy::kBestEffort);
    ASSERT_TRUE(result.ok()) << result.error_message;
    EXPECT_EQ(result.data->size(), 3u);
    EXPECT_EQ(result.data->count(Name::parse("registry.example/library/llama:broken")), 0u);
    EXPECT_NE(log_stream.str().find("[warning] bad manifest"), std::string::npos);
}

TEST_F(RegistryScanTest, StrictScanFailsOnInvalidName) {
    writeGood("mistral");
    test::write_file(root() / "registry.example" / "library" / "llama" / "-bad", "{}");

    auto strict = store->listAll(ScanPolicy::kStrict);
    EXPECT_EQ(strict.error, StoreErrorCode::kInvalidName);

    auto tolerant = store->listAll(ScanPolicy::kBestEffort);
    ASSERT_TRUE(tolerant.ok());
    EXPECT_EQ(tolerant.data->size(), 1u);
    EXPECT_NE(log_stream.str().find("bad manifest name"), std::string::npos);
}

TEST_F(RegistryScanTest, DirectoriesAtLeafDepthAreSkipped) {
    writeGood("mistral");
    fs::create_directories(root() / "h" / "n" / "m" / "t");

    auto result = store->listAll(ScanPolicy::kStrict);
    ASSERT_TRUE(result.ok()) << result.error_message;
    EXPECT_EQ(result.data->size(), 1u);
}

TEST_F(RegistryScanTest, StagingDirectoryIsNeverACandidate) {
    writeGood("mistral");
    test::write_file(root() / ".staging" / "manifest-abc123", "{partial");

    auto result = store->listAll(ScanPolicy::kStrict);
    ASSERT_TRUE(result.ok()) << result.error_message;
    EXPECT_EQ(result.data->size(), 1u);
}
