#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "steenbok/infra/fetch_guard.hpp"

namespace steenbok::cli {

/// Process exit codes of `steenbok fetch`.
enum ExitCode : int {
    kExitOk = 0,
    kExitFailure = 1,
    kExitAllowlistRejected = 2,
    kExitRejected = 3,
    kExitExtractionFailed = 4,
};

/// Global options shared by every subcommand.
struct CommandContext {
    std::string config_path;
    std::string log_level;
    int exit_code = kExitOk;
};

/// Exit code for a fetch outcome (success maps to kExitOk).
[[nodiscard]] auto exit_code_for(const infra::FetchOutcome& outcome) -> int;

/// Register the `fetch` subcommand.
/// Fetches one URL through the guard and prints the extracted text.
void register_fetch_command(CLI::App& app, CommandContext& ctx);

/// Register the `serve` subcommand.
/// Runs the loopback fetch endpoint until SIGINT/SIGTERM.
void register_serve_command(CLI::App& app, CommandContext& ctx);

/// Register the `allowlist` subcommand.
/// Prints the effective domain allowlist.
void register_allowlist_command(CLI::App& app, CommandContext& ctx);

} // namespace steenbok::cli
