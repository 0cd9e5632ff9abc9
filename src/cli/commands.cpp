#include "shellguard/cli/commands.hpp"

#include "shellguard/agent/exec_tool.hpp"
#include "shellguard/core/logger.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

namespace shellguard::cli {

using json = nlohmann::json;

namespace {

struct CommandOptions {
    std::string command;
    std::string cwd;
    int timeout = 0;
};

auto optional_cwd(const std::string& cwd) -> std::optional<std::string> {
    if (cwd.empty()) return std::nullopt;
    return cwd;
}

/// Builds the tool or reports the configuration error and exits with 2.
auto make_tool(const Config& config) -> std::unique_ptr<agent::ExecTool> {
    auto tool = agent::ExecTool::create(config);
    if (!tool) {
        std::cerr << "Error: " << tool.error().what() << "\n";
        throw CLI::RuntimeError(2);
    }
    return std::move(*tool);
}

/// Runs one command on a private io_context. SIGINT/SIGTERM abandon the
/// invocation, which kills the child's process group.
auto run_to_completion(agent::ExecTool& tool, std::string command,
                       std::optional<std::string> cwd) -> std::optional<std::string> {
    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    std::optional<std::string> output;

    signals.async_wait([&ioc](auto ec, int sig) {
        if (!ec) {
            LOG_WARN("Received signal {}, abandoning command", sig);
            ioc.stop();
        }
    });

    boost::asio::co_spawn(
        ioc,
        [&]() -> boost::asio::awaitable<void> {
            output = co_await tool.execute_command(std::move(command), std::move(cwd));
            signals.cancel();
        },
        boost::asio::detached);

    ioc.run();
    return output;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("run", "Guard and execute a shell command");
    auto opts = std::make_shared<CommandOptions>();

    sub->add_option("command", opts->command, "Command line to execute")->required();
    sub->add_option("--cwd", opts->cwd, "Working directory (overrides config)");
    sub->add_option("--timeout", opts->timeout, "Timeout in seconds (overrides config)")
        ->check(CLI::PositiveNumber);

    sub->callback([&config, opts]() {
        Logger::init("shellguard", config.log_level);

        Config cfg = config;
        if (opts->timeout > 0) {
            cfg.tools.exec.timeout = opts->timeout;
        }

        auto tool = make_tool(cfg);
        auto output = run_to_completion(*tool, opts->command, optional_cwd(opts->cwd));
        if (!output) {
            throw CLI::RuntimeError(130);
        }
        std::cout << *output << "\n";
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("check", "Evaluate a command against the policy without running it");
    auto opts = std::make_shared<CommandOptions>();

    sub->add_option("command", opts->command, "Command line to evaluate")->required();
    sub->add_option("--cwd", opts->cwd, "Working directory (overrides config)");

    sub->callback([&config, opts]() {
        Logger::init("shellguard", config.log_level);

        auto tool = make_tool(config);
        auto cwd = tool->effective_working_dir(optional_cwd(opts->cwd));
        auto decision = tool->command_guard().evaluate(opts->command, cwd);

        if (decision.permitted()) {
            std::cout << "permitted\n";
            return;
        }

        std::cout << guard::rejection_message(*decision.reason) << "\n";
        if (!decision.detail.empty()) {
            std::cout << "  matched: " << decision.detail << "\n";
        }
        throw CLI::RuntimeError(1);
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    auto config_file = std::make_shared<std::string>();
    sub->add_option("-f,--file", *config_file,
                    "Path to configuration file to inspect")
        ->check(CLI::ExistingFile);

    sub->callback([&config, validate_only, config_file]() {
        Logger::init("shellguard", config.log_level);

        Config cfg = config;
        if (!config_file->empty()) {
            cfg = load_config(std::filesystem::path(*config_file));
            apply_env_overrides(cfg);
        }

        if (*validate_only) {
            // Patterns are only known to be valid once they compile.
            auto valid = validate_config(cfg);
            if (valid) {
                auto policy = guard::Policy::from_config(cfg.tools.exec,
                                                         cfg.tools.restrict_to_workspace);
                if (!policy) valid = std::unexpected(policy.error());
            }
            if (!valid) {
                std::cout << "Configuration is invalid: " << valid.error().what() << "\n";
                throw CLI::RuntimeError(1);
            }
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = cfg;
        std::cout << j.dump(2) << "\n";
    });
}

} // namespace shellguard::cli
