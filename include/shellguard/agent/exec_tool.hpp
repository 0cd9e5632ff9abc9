#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "shellguard/agent/tool.hpp"
#include "shellguard/core/config.hpp"
#include "shellguard/exec/process_runner.hpp"
#include "shellguard/guard/command_guard.hpp"

namespace shellguard::agent {

/// The "exec" tool: guards a shell command and, when permitted, runs it.
///
/// Every outcome is text. Rejections, timeouts and spawn failures come back
/// as "Error: ..." strings the agent can read and act on; only malformed JSON
/// parameters fail the JSON entry point.
class ExecTool : public Tool {
public:
    /// Validates the configuration and compiles the policy.
    static auto create(const Config& config) -> Result<std::unique_ptr<ExecTool>>;

    ExecTool(std::shared_ptr<const guard::Policy> policy, exec::RunnerOptions options,
             std::optional<std::filesystem::path> default_working_dir);

    [[nodiscard]] auto definition() const -> ToolDefinition override;

    /// Params: {"command": string, "working_dir": string (optional)}.
    /// Result: {"output": string}.
    auto execute(json params) -> awaitable<Result<json>> override;

    /// Runs `command` in `working_dir`, else the configured default, else the
    /// process's current directory. The guard decision always comes first;
    /// the runner is only reached on Permit.
    auto execute_command(std::string command,
                         std::optional<std::string> working_dir = std::nullopt)
        -> awaitable<std::string>;

    /// Working directory a request would run in.
    [[nodiscard]] auto effective_working_dir(const std::optional<std::string>& requested) const
        -> std::filesystem::path;

    [[nodiscard]] auto command_guard() const noexcept -> const guard::CommandGuard& { return guard_; }
    [[nodiscard]] auto runner() const noexcept -> const exec::ProcessRunner& { return runner_; }

private:
    guard::CommandGuard guard_;
    exec::ProcessRunner runner_;
    std::optional<std::filesystem::path> default_working_dir_;
};

/// RunnerOptions derived from the exec section of the configuration.
auto runner_options_from_config(const ExecConfig& cfg) -> exec::RunnerOptions;

} // namespace shellguard::agent
