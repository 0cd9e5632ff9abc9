#include "shellguard/cli/app.hpp"
#include "shellguard/cli/commands.hpp"
#include "shellguard/core/logger.hpp"

#include <filesystem>

// Version string; injected by CMake via -DSHELLGUARD_VERSION_STRING=...
#ifndef SHELLGUARD_VERSION_STRING
#define SHELLGUARD_VERSION_STRING "0.1.0-dev"
#endif

namespace shellguard::cli {

App::App()
    : cli_("shellguard", "Guarded shell command execution"),
      config_(load_config_from_env())
{
    cli_.set_version_flag("--version", SHELLGUARD_VERSION_STRING,
                          "Display version information");

    // Option callbacks run before subcommand callbacks, so the file is
    // loaded (and the environment re-applied on top) before any command.
    cli_.add_option_function<std::string>(
            "-c,--config",
            [this](const std::string& path) {
                LOG_INFO("Loading configuration from: {}", path);
                config_ = load_config(std::filesystem::path(path));
                apply_env_overrides(config_);
            },
            "Path to configuration file (JSON)")
        ->envname("SHELLGUARD_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option_function<std::string>(
        "--log-level",
        [this](const std::string& level) { config_.log_level = level; },
        "Log level (trace, debug, info, warn, error, critical)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Also carries the non-zero exit codes raised by subcommands.
        Logger::flush();
        return cli_.exit(e);
    }

    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_run_command(cli_, config_);
    register_check_command(cli_, config_);
    register_config_command(cli_, config_);
}

} // namespace shellguard::cli
