// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/cli/commands.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace summon::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void summon_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(summon_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }

    if (args.version) {
        print_version();
        return EXIT_OK;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_FAILED;
    }

    if (args.url.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_FAILED;
    }

    setup_logging(args.verbose, args.quiet);

    auto result = args.info ? info(args.url) : download(args);
    if (!result) {
        return EXIT_FAILED;
    }
    return *result;
}
