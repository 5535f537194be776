#pragma once

#include <string>

namespace layerstore {

/// Subcommand types for the layerstore CLI
enum class Subcommand {
    None,    // No subcommand (prints help)
    List,    // list
    Show,    // show <model>
    Rm,      // rm <model>
    Verify,  // verify <model>
};

/// Options for list command
struct ListOptions {
    bool strict{false};  // fail on the first unreadable manifest
};

/// Options for show command
struct ShowOptions {
    std::string model;
    bool json{false};    // print the manifest document only
};

/// Options for rm command
struct RmOptions {
    std::string model;
    bool keep_layers{false};
};

/// Options for verify command
struct VerifyOptions {
    std::string model;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};

    ListOptions list_options;
    ShowOptions show_options;
    RmOptions rm_options;
    VerifyOptions verify_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace layerstore
