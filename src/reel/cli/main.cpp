// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace reel::cli;

// Reports exceptions escaping noexcept code before aborting
static void reel_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(reel_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }

    if (args.version) {
        print_version();
        return EXIT_OK;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cout << "Use -h for help" << std::endl;
        return EXIT_FAILED;
    }

    if (args.url.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return EXIT_FAILED;
    }

    try {
        return download(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
}
