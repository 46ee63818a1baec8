// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/cli/commands.hpp>
#include <spool/core/logging.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace spool::cli;

// Terminate handler to catch exceptions in noexcept functions
static void spool_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(spool_terminate_handler);
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }

    spool::core::ServiceConfig config;
    if (!args.config_path.empty()) {
        auto loaded = spool::core::load_config(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Cannot load config " << args.config_path << ": "
                      << loaded.error().message() << std::endl;
            return 1;
        }
        config = std::move(*loaded);
    }
    if (args.workers > 0) {
        config.workers = args.workers;
    }

    if (args.verbose) {
        spool::core::init_logging("debug");
    } else if (args.quiet) {
        spool::core::init_logging("warn");
    } else {
        spool::core::init_logging(config.log_level);
    }

    if (args.command.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    const auto& ops = args.operands;
    CliResult result;

    if (args.command == "register") {
        if (ops.empty()) {
            std::cerr << "Error: register needs an NZB file" << std::endl;
            return 1;
        }
        result = register_file(config, ops[0], ops.size() > 1 ? ops[1] : std::string{});
    } else if (args.command == "ls") {
        result = list(config, ops.empty() ? std::string{} : ops[0]);
    } else if (args.command == "stat") {
        if (ops.empty()) {
            std::cerr << "Error: stat needs a path" << std::endl;
            return 1;
        }
        result = spool::cli::stat(config, ops[0]);
    } else if (args.command == "sweep") {
        result = sweep(config);
    } else if (args.command == "window") {
        if (ops.size() < 2) {
            std::cerr << "Error: window needs <start> <end>" << std::endl;
            return 1;
        }
        result = spool::cli::window(config, ops[0], ops[1]);
    } else {
        std::cerr << "Error: Unknown command " << args.command << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    return result ? *result : 1;
}
