#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "cli/commands.h"
#include "store/manifest_store.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"

int main(int argc, char* argv[]) {
    using namespace layerstore;

    CliResult cli = parseCliArgs(argc, argv);
    if (cli.should_exit) {
        (cli.exit_code == 0 ? std::cout : std::cerr) << cli.output;
        return cli.exit_code;
    }
    if (cli.subcommand == Subcommand::None) {
        std::cout << getHelpMessage();
        return 0;
    }

    logger::init_from_env();

    auto [config, source] = loadStoreConfigWithLog();
    spdlog::debug("Store config: models_dir={} ({})", config.models_dir, source);

    ManifestStore store(config, spdlog::default_logger());

    switch (cli.subcommand) {
        case Subcommand::List:
            return cli::commands::list(cli.list_options, store);
        case Subcommand::Show:
            return cli::commands::show(cli.show_options, store);
        case Subcommand::Rm:
            return cli::commands::rm(cli.rm_options, store);
        case Subcommand::Verify:
            return cli::commands::verify(cli.verify_options, store);
        case Subcommand::None:
            break;
    }
    return 0;
}
