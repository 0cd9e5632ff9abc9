#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "shellguard/core/config.hpp"

namespace shellguard::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (run, check, config). The configuration is
/// loaded while options are parsed, so it is complete before any
/// subcommand callback runs.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    CLI::App cli_;
    Config config_;
};

} // namespace shellguard::cli
