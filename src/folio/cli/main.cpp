// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cli/commands.hpp>
#include <folio/core/logger.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace folio;

// Terminate handler to report exceptions escaping noexcept code
static void folio_terminate_handler() {
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
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    core::Logger::instance().flush();
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(folio_terminate_handler);

    cli::CliArgs args = cli::parse_args(argc, argv);

    if (args.help) {
        cli::print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        cli::print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }
    if (args.command == cli::Command::none) {
        cli::print_help(argv[0]);
        return 1;
    }

    // Blocks the termination signals before any worker thread exists
    core::ShutdownContext shutdown;
    core::SignalWatcher watcher(shutdown);

    auto config_path = args.config_path.empty() ? core::Settings::default_path()
                                                : std::filesystem::path(args.config_path);
    auto settings = core::Settings::load(config_path);
    if (!settings) {
        std::cerr << "Error: cannot load settings " << config_path.string()
                  << ": " << settings.error().message() << std::endl;
        return 1;
    }
    cli::apply_overrides(args, *settings);

    auto level = core::parse_log_level(settings->log_level).value_or(core::LogLevel::info);
    if (args.verbose) level = core::LogLevel::debug;
    if (args.quiet) level = core::LogLevel::warn;
    core::Logger::instance().initialize(level, settings->log_file);

    core::CurlHttpClient::global_init();

    int exit_code = 0;
    {
        cli::Session session(std::move(*settings), shutdown);
        auto result = cli::run(session, args);
        if (!result) {
            std::cerr << "Error: " << result.error().message() << std::endl;
            exit_code = 1;
        } else {
            exit_code = *result;
        }
    }

    // Transfers abandoned by a shutdown may still hold curl handles
    if (!shutdown.requested()) {
        core::CurlHttpClient::global_cleanup();
    }
    core::Logger::instance().flush();
    return exit_code;
}
