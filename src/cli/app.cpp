#include "steenbok/cli/app.hpp"
#include "steenbok/core/logger.hpp"

// Version string; typically injected by CMake via -DSTEENBOK_VERSION_STRING=...
#ifndef STEENBOK_VERSION_STRING
#define STEENBOK_VERSION_STRING "1.0.0-dev"
#endif

namespace steenbok::cli {

App::App()
    : cli_("steenbok", "SSRF-hardened fetcher for allowlisted research sources")
{
    cli_.set_version_flag("--version", STEENBOK_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("STEENBOK_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("STEENBOK_LOG_LEVEL");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    Logger::init("steenbok", "info");

    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // The selected subcommand's callback ran inside parse().
    Logger::flush();
    return context_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::context() -> CommandContext& {
    return context_;
}

void App::setup_commands() {
    register_fetch_command(cli_, context_);
    register_serve_command(cli_, context_);
    register_allowlist_command(cli_, context_);
}

} // namespace steenbok::cli
