#include "utils/cli.h"
#include "utils/version.h"
#include <sstream>
#include <cstring>

namespace layerstore {

namespace {

std::string getListHelpMessage() {
    std::ostringstream oss;
    oss << "layerstore list - List local models\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    layerstore list [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --strict         Fail if any manifest cannot be read\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getShowHelpMessage() {
    std::ostringstream oss;
    oss << "layerstore show - Show a model manifest\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    layerstore show <MODEL> [OPTIONS]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <MODEL>          Model name (e.g., llama3.2, registry.example/library/llama:7b)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --json           Print the manifest document only\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getRmHelpMessage() {
    std::ostringstream oss;
    oss << "layerstore rm - Delete a model\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    layerstore rm <MODEL> [OPTIONS]\n";
    oss << "\n";
    oss << "Blobs still used by other models are kept.\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --keep-layers    Delete the manifest only\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getVerifyHelpMessage() {
    std::ostringstream oss;
    oss << "layerstore verify - Check a model's blobs against its manifest\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    layerstore verify <MODEL>\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

void fail(CliResult& result, const std::string& message, const std::string& usage) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\nUsage: " + usage + "\n";
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "layerstore " << LAYERSTORE_VERSION << " - local model package store\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    layerstore <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    list       List local models\n";
    oss << "    show       Show a model manifest\n";
    oss << "    rm         Delete a model\n";
    oss << "    verify     Check a model's blobs\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    LAYERSTORE_MODELS               Model store directory (default: ~/.layerstore/models)\n";
    oss << "    LAYERSTORE_CONFIG               Config file path (default: ~/.layerstore/config.json)\n";
    oss << "    LAYERSTORE_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n";
    oss << "    LAYERSTORE_LOG_DIR              Log directory (default: ~/.layerstore/logs)\n";
    oss << "    LAYERSTORE_LOG_RETENTION_DAYS   Log retention days (default: 7)\n";
    oss << "\n";
    oss << "Run 'layerstore <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "layerstore " << LAYERSTORE_VERSION << "\n";
    return oss.str();
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    if (argc < 2) {
        return result;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "list") == 0) {
        result.subcommand = Subcommand::List;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getListHelpMessage();
            return result;
        }
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--strict") == 0) {
                result.list_options.strict = true;
            } else {
                fail(result, std::string("unexpected argument '") + argv[i] + "'", "layerstore list [--strict]");
                return result;
            }
        }
        return result;
    }

    if (std::strcmp(command, "show") == 0) {
        result.subcommand = Subcommand::Show;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getShowHelpMessage();
            return result;
        }
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--json") == 0) {
                result.show_options.json = true;
            } else if (argv[i][0] != '-' && result.show_options.model.empty()) {
                result.show_options.model = argv[i];
            }
        }
        if (result.show_options.model.empty()) {
            fail(result, "model name required", "layerstore show <MODEL>");
        }
        return result;
    }

    if (std::strcmp(command, "rm") == 0) {
        result.subcommand = Subcommand::Rm;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getRmHelpMessage();
            return result;
        }
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--keep-layers") == 0) {
                result.rm_options.keep_layers = true;
            } else if (argv[i][0] != '-' && result.rm_options.model.empty()) {
                result.rm_options.model = argv[i];
            }
        }
        if (result.rm_options.model.empty()) {
            fail(result, "model name required", "layerstore rm <MODEL>");
        }
        return result;
    }

    if (std::strcmp(command, "verify") == 0) {
        result.subcommand = Subcommand::Verify;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getVerifyHelpMessage();
            return result;
        }
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                result.verify_options.model = argv[i];
                break;
            }
        }
        if (result.verify_options.model.empty()) {
            fail(result, "model name required", "layerstore verify <MODEL>");
        }
        return result;
    }

    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << (command[0] == '-' ? "Unknown option: " : "Unknown command: ") << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::List: return "list";
        case Subcommand::Show: return "show";
        case Subcommand::Rm: return "rm";
        case Subcommand::Verify: return "verify";
    }
    return "unknown";
}

}  // namespace layerstore
