#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "steenbok/cli/commands.hpp"

namespace steenbok::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the `fetch`,
/// `serve` and `allowlist` subcommands. Subcommands load the configuration
/// themselves and report their exit code through the shared context.
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto context() -> CommandContext&;

private:
    void setup_commands();

    CLI::App cli_;
    CommandContext context_;
};

} // namespace steenbok::cli
