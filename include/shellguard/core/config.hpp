#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "shellguard/core/error.hpp"

// std::optional serializer for nlohmann/json, so the WITH_DEFAULT macros
// accept optional members (null <-> nullopt).
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace shellguard {

using json = nlohmann::json;

struct ExecConfig {
    int timeout = 60;                                        // seconds
    std::optional<std::string> working_dir;                  // default cwd for commands
    std::optional<std::vector<std::string>> deny_patterns;   // null/empty = built-in set
    std::vector<std::string> allow_patterns;                 // empty = no allow-list
    int max_output_chars = 10000;
    int kill_grace_seconds = 5;
    std::string shell = "/bin/sh";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExecConfig, timeout, working_dir, deny_patterns, allow_patterns, max_output_chars, kill_grace_seconds, shell)

struct ToolsConfig {
    ExecConfig exec;
    bool restrict_to_workspace = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ToolsConfig, exec, restrict_to_workspace)

struct Config {
    ToolsConfig tools;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, tools, log_level)

/// Loads a JSON config file. Falls back to defaults (with a warning) when the
/// file is missing or unparseable. `${VAR}` references in working_dir are resolved.
auto load_config(const std::filesystem::path& path) -> Config;

/// Defaults with SHELLGUARD_* environment overrides applied. The config file
/// itself (SHELLGUARD_CONFIG or -c) is loaded by the CLI.
auto load_config_from_env() -> Config;

auto default_config() -> Config;

/// Applies SHELLGUARD_LOG_LEVEL, SHELLGUARD_EXEC_TIMEOUT,
/// SHELLGUARD_RESTRICT_TO_WORKSPACE and SHELLGUARD_WORKING_DIR.
void apply_env_overrides(Config& config);

/// Rewrites camelCase object keys ("restrictToWorkspace") to snake_case.
/// When both spellings are present the snake_case one is kept.
void normalize_key_case(json& j);

/// Rewrites keys written by older releases into their current location.
void migrate_legacy_keys(json& j);

auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace shellguard
