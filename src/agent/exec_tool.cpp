#include "shellguard/agent/exec_tool.hpp"

#include "shellguard/core/logger.hpp"
#include "shellguard/core/utils.hpp"
#include "shellguard/exec/run_outcome.hpp"

#include <system_error>
#include <utility>

namespace shellguard::agent {

namespace fs = std::filesystem;

auto runner_options_from_config(const ExecConfig& cfg) -> exec::RunnerOptions {
    exec::RunnerOptions options;
    options.timeout = std::chrono::seconds(cfg.timeout);
    options.kill_grace = std::chrono::seconds(cfg.kill_grace_seconds);
    options.max_output_chars = static_cast<std::size_t>(cfg.max_output_chars);
    options.shell = cfg.shell;
    return options;
}

auto ExecTool::create(const Config& config) -> Result<std::unique_ptr<ExecTool>> {
    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }

    auto policy = guard::Policy::from_config(config.tools.exec,
                                             config.tools.restrict_to_workspace);
    if (!policy) {
        return std::unexpected(policy.error());
    }

    std::optional<fs::path> default_dir;
    if (config.tools.exec.working_dir && !config.tools.exec.working_dir->empty()) {
        default_dir = fs::path(*config.tools.exec.working_dir);
    }

    return std::make_unique<ExecTool>(
        std::make_shared<const guard::Policy>(std::move(*policy)),
        runner_options_from_config(config.tools.exec),
        std::move(default_dir));
}

ExecTool::ExecTool(std::shared_ptr<const guard::Policy> policy, exec::RunnerOptions options,
                   std::optional<fs::path> default_working_dir)
    : guard_(std::move(policy)),
      runner_(std::move(options)),
      default_working_dir_(std::move(default_working_dir)) {}

auto ExecTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "exec",
        .description = "Execute a shell command and return its output. "
                       "Destructive commands, inline interpreters and command "
                       "substitution ($(...) or backticks) are blocked.",
        .parameters = {
            ToolParameter{
                .name = "command",
                .type = "string",
                .description = "The shell command to execute",
                .required = true,
            },
            ToolParameter{
                .name = "working_dir",
                .type = "string",
                .description = "Optional working directory for the command",
                .required = false,
            },
        },
    };
}

auto ExecTool::effective_working_dir(const std::optional<std::string>& requested) const
    -> fs::path {
    if (requested && !requested->empty()) {
        return fs::path(*requested);
    }
    if (default_working_dir_) {
        return *default_working_dir_;
    }
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        LOG_WARN("Cannot determine current directory: {}", ec.message());
        return fs::path(".");
    }
    return cwd;
}

auto ExecTool::execute(json params) -> awaitable<Result<json>> {
    if (!params.is_object() || !params.contains("command") || !params["command"].is_string()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Missing or invalid parameter", "command"));
    }

    std::optional<std::string> working_dir;
    if (params.contains("working_dir") && !params["working_dir"].is_null()) {
        if (!params["working_dir"].is_string()) {
            co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                           "Missing or invalid parameter", "working_dir"));
        }
        working_dir = params["working_dir"].get<std::string>();
    }

    auto output = co_await execute_command(params["command"].get<std::string>(),
                                           std::move(working_dir));
    co_return json{{"output", std::move(output)}};
}

auto ExecTool::execute_command(std::string command, std::optional<std::string> working_dir)
    -> awaitable<std::string> {
    auto cwd = effective_working_dir(working_dir);

    auto decision = guard_.evaluate(command, cwd);
    if (!decision.permitted()) {
        co_return guard::rejection_message(*decision.reason);
    }

    auto outcome = co_await runner_.run(std::move(command), cwd);
    if (!outcome) {
        co_return utils::sanitize_utf8("Error executing command: " + outcome.error().what());
    }

    auto rendered = exec::render_outcome(*outcome, runner_.options().max_output_chars);
    if (rendered.truncated) {
        LOG_DEBUG("Output truncated, {} chars omitted", rendered.omitted);
    }
    co_return std::move(rendered.text);
}

} // namespace shellguard::agent
