#pragma once

#include <CLI/CLI.hpp>

#include "shellguard/core/config.hpp"

namespace shellguard::cli {

/// Register the `run` subcommand.
/// Guards and executes a command, printing the result text.
void register_run_command(CLI::App& app, Config& config);

/// Register the `check` subcommand.
/// Evaluates a command against the policy without running it.
/// Exits 1 when the command would be rejected.
void register_check_command(CLI::App& app, Config& config);

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
void register_config_command(CLI::App& app, Config& config);

} // namespace shellguard::cli
