#include "app/cli_args.hpp"
#include "app/commands.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <csignal>
#include <format>
#include <iostream>

#ifndef SYSMLSQL_VERSION
#define SYSMLSQL_VERSION "0.0.0"
#endif

using namespace sysmlsql;

// Set by SIGINT/SIGTERM; a running fetch polls it and cancels itself
static std::atomic<bool> g_interrupted{false};

extern "C" void signal_handler(int /*signal*/) {
    g_interrupted.store(true);
}

int main(int argc, char* argv[]) {
    CliOptions options;
    std::string error;
    if (!parse_cli_args(argc, argv, options, error)) {
        std::cerr << "sysml-sql: " << error << "\n";
        std::cerr << "Try 'sysml-sql --help' for more information.\n";
        return kExitUsage;
    }
    if (options.show_help) {
        print_help(std::cout);
        return kExitOk;
    }
    if (options.show_version) {
        std::cout << "sysml-sql " << SYSMLSQL_VERSION << "\n";
        return kExitOk;
    }

    try {
        auto loaded = options.config_path.empty()
            ? ConfigLoader::load_defaults()
            : ConfigLoader::load_from_file(options.config_path);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitFailure;
        }

        const auto config = apply_cli_overrides(std::move(loaded.config), options);
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        if (!options.config_path.empty()) {
            utils::log::debug(std::format("configuration loaded from {}", options.config_path));
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        return run_command(options, config, &g_interrupted);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFailure;
    }
}
