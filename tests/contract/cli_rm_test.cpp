// Contract tests for 'rm' command

#include "contract_fixture.h"

#include <filesystem>

using namespace layerstore;
using CliRmTest = layerstore::test::CommandContractTest;
namespace fs = std::filesystem;

// Contract: rm requires a model name
TEST_F(CliRmTest, RequiresModelName) {
    auto result = parse({"layerstore", "rm"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("model"), std::string::npos);
}

// Contract: rm parses model name
TEST_F(CliRmTest, ParseModelName) {
    auto result = parse({"layerstore", "rm", "llama3.2", "--keep-layers"});

    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::Rm);
    EXPECT_EQ(result.rm_options.model, "llama3.2");
    EXPECT_TRUE(result.rm_options.keep_layers);
}

// Contract: rm --help shows usage
TEST_F(CliRmTest, ShowHelp) {
    auto result = parse({"layerstore", "rm", "--help"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("rm"), std::string::npos);
}

// Contract: exit code 1 if model not found
TEST_F(CliRmTest, ReturnsErrorIfModelNotFound) {
    RmOptions options;
    options.model = "missing";

    EXPECT_EQ(cli::commands::rm(options, *store, out, err), 1);
    EXPECT_NE(err.str().find("not found"), std::string::npos);
}

// Contract: prints "deleted '<model>'" and removes manifest and blobs
TEST_F(CliRmTest, DeletesModelAndBlobs) {
    auto m = addModel("llama3.2", "weights");
    RmOptions options;
    options.model = "llama3.2";

    EXPECT_EQ(cli::commands::rm(options, *store, out, err), 0);

    EXPECT_EQ(out.str(), "deleted 'llama3.2'\n");
    EXPECT_FALSE(fs::exists(m.filepath));
    EXPECT_FALSE(fs::exists(test::blob_file(temp.path, m.layers[0])));
    EXPECT_FALSE(fs::exists(test::blob_file(temp.path, m.config)));
    EXPECT_FALSE(fs::exists(temp.path / "manifests" / "registry.ollama.ai"));
}

TEST_F(CliRmTest, KeepLayersLeavesBlobs) {
    auto m = addModel("llama3.2", "weights");
    RmOptions options;
    options.model = "llama3.2";
    options.keep_layers = true;

    EXPECT_EQ(cli::commands::rm(options, *store, out, err), 0);

    EXPECT_FALSE(fs::exists(m.filepath));
    EXPECT_TRUE(fs::exists(test::blob_file(temp.path, m.layers[0])));
}

// Contract: blobs shared with another model survive
TEST_F(CliRmTest, SharedBlobsSurvive) {
    auto a = addModel("llama3.2", "shared-weights");
    auto b = addModel("llama3.2:q4", "shared-weights");
    ASSERT_EQ(a.layers[0], b.layers[0]);
    RmOptions options;
    options.model = "llama3.2";

    EXPECT_EQ(cli::commands::rm(options, *store, out, err), 0);

    EXPECT_TRUE(fs::exists(test::blob_file(temp.path, a.layers[0])));
    EXPECT_TRUE(fs::exists(test::blob_file(temp.path, a.config)));
    EXPECT_TRUE(store->parse(Name::parse("llama3.2:q4")).ok());
}
