// Contract tests for 'list' command

#include "contract_fixture.h"

#include <algorithm>

using namespace layerstore;
using CliListTest = layerstore::test::CommandContractTest;

// Contract: list takes no arguments
TEST_F(CliListTest, ParseListCommand) {
    auto result = parse({"layerstore", "list"});

    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::List);
    EXPECT_FALSE(result.list_options.strict);
}

TEST_F(CliListTest, ParseStrictFlag) {
    auto result = parse({"layerstore", "list", "--strict"});

    EXPECT_FALSE(result.should_exit);
    EXPECT_TRUE(result.list_options.strict);
}

TEST_F(CliListTest, RejectsUnexpectedArgument) {
    auto result = parse({"layerstore", "list", "llama"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("unexpected argument 'llama'"), std::string::npos);
}

TEST_F(CliListTest, ShowHelp) {
    auto result = parse({"layerstore", "list", "--help"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("--strict"), std::string::npos);
}

// Contract: empty store prints only the header
TEST_F(CliListTest, EmptyStorePrintsHeader) {
    EXPECT_EQ(cli::commands::list({}, *store, out, err), 0);

    const std::string text = out.str();
    EXPECT_NE(text.find("NAME"), std::string::npos);
    EXPECT_NE(text.find("MODIFIED"), std::string::npos);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 1);
}

// Contract: one row per model, shortest name, 12 char id
TEST_F(CliListTest, PrintsOneRowPerModel) {
    auto llama = addModel("llama3.2", "weights-a");
    addModel("registry.example/team/qwen:1b", "weights-b");

    EXPECT_EQ(cli::commands::list({}, *store, out, err), 0);

    const std::string text = out.str();
    EXPECT_NE(text.find("llama3.2:latest"), std::string::npos);
    EXPECT_NE(text.find("registry.example/team/qwen:1b"), std::string::npos);
    EXPECT_NE(text.find(llama.digest.substr(0, 12)), std::string::npos);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 3);
}

// Contract: default list skips unreadable manifests, --strict fails
TEST_F(CliListTest, CorruptManifestHandling) {
    addModel("llama3.2", "weights-a");
    test::write_file(temp.path / "manifests" / "registry.ollama.ai" / "library" / "broken" / "latest", "{");

    EXPECT_EQ(cli::commands::list({}, *store, out, err), 0);
    EXPECT_NE(out.str().find("llama3.2:latest"), std::string::npos);
    EXPECT_EQ(out.str().find("broken"), std::string::npos);

    ListOptions strict;
    strict.strict = true;
    std::ostringstream strict_out;
    EXPECT_EQ(cli::commands::list(strict, *store, strict_out, err), 1);
    EXPECT_NE(err.str().find("Error:"), std::string::npos);
}

TEST(CliFormatSizeTest, UsesBinaryUnits) {
    EXPECT_EQ(cli::formatSize(0), "0 B");
    EXPECT_EQ(cli::formatSize(1023), "1023 B");
    EXPECT_EQ(cli::formatSize(4106), "4 KB");
    EXPECT_EQ(cli::formatSize(5ULL * 1024 * 1024), "5 MB");
    EXPECT_EQ(cli::formatSize(3ULL * 1024 * 1024 * 1024), "3 GB");
}
