#include <exception>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <streamcache/version.hpp>

#include "cmd_fetch.h"

int main(int argc, char* argv[]) {
    try {
        // Conservative default; -v raises it
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"streamcache - progressive download cache"};
        app.set_version_flag("--version", streamcache::version::long_string_v);
        app.add_flag_callback(
            "-v,--verbose", [] { spdlog::set_level(spdlog::level::debug); },
            "Enable debug logging.");
        app.require_subcommand(1);

        int exitCode = 0;
        streamcache::cli::registerFetchCommand(app, exitCode);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app.exit(e);
        }
        return exitCode;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
