#include "shellguard/core/config.hpp"
#include "shellguard/core/logger.hpp"
#include "shellguard/core/utils.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace shellguard {

namespace {

auto fits_int(const json& value) -> bool {
    auto v = value.get<double>();
    return v >= static_cast<double>(std::numeric_limits<int>::min()) &&
           v <= static_cast<double>(std::numeric_limits<int>::max());
}

// Numeric exec settings that do not fit an int are dropped (keeping the
// default) instead of wrapping on conversion.
void drop_out_of_range_numbers(json& j) {
    if (!j.is_object() || !j.contains("tools") || !j["tools"].is_object()) return;
    auto& tools = j["tools"];
    if (!tools.contains("exec") || !tools["exec"].is_object()) return;

    auto& exec = tools["exec"];
    for (const char* key : {"timeout", "max_output_chars", "kill_grace_seconds"}) {
        if (exec.contains(key) && exec[key].is_number() && !fits_int(exec[key])) {
            LOG_WARN("Config: tools.exec.{} is out of range ({}), using the default", key,
                     exec[key].dump());
            exec.erase(key);
        }
    }
}

} // namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        normalize_key_case(j);
        migrate_legacy_keys(j);
        drop_out_of_range_numbers(j);

        auto config = j.get<Config>();
        if (config.tools.exec.working_dir) {
            config.tools.exec.working_dir = resolve_env_refs(*config.tools.exec.working_dir);
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    auto config = default_config();
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("SHELLGUARD_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("SHELLGUARD_EXEC_TIMEOUT")) {
        auto seconds = utils::parse_int(val);
        if (seconds && *seconds >= std::numeric_limits<int>::min() &&
            *seconds <= std::numeric_limits<int>::max()) {
            config.tools.exec.timeout = static_cast<int>(*seconds);
        } else if (seconds) {
            LOG_WARN("Ignoring SHELLGUARD_EXEC_TIMEOUT: out of range ({})", val);
        } else {
            LOG_WARN("Ignoring SHELLGUARD_EXEC_TIMEOUT: not an integer ({})", val);
        }
    }
    if (auto* val = std::getenv("SHELLGUARD_RESTRICT_TO_WORKSPACE")) {
        if (auto flag = utils::parse_bool(val)) {
            config.tools.restrict_to_workspace = *flag;
        } else {
            LOG_WARN("Ignoring SHELLGUARD_RESTRICT_TO_WORKSPACE: not a boolean ({})", val);
        }
    }
    if (auto* val = std::getenv("SHELLGUARD_WORKING_DIR")) {
        config.tools.exec.working_dir = resolve_env_refs(val);
    }
}

void normalize_key_case(json& j) {
    if (j.is_array()) {
        for (auto& item : j) normalize_key_case(item);
        return;
    }
    if (!j.is_object()) {
        return;
    }

    json normalized = json::object();
    for (auto& [key, value] : j.items()) {
        normalize_key_case(value);
        auto snake = utils::camel_to_snake(key);
        if (snake != key && j.contains(snake)) {
            LOG_WARN("Config: both {} and {} are set, using {}", key, snake, snake);
            continue;
        }
        normalized[snake] = std::move(value);
    }
    j = std::move(normalized);
}

void migrate_legacy_keys(json& j) {
    if (!j.is_object() || !j.contains("tools") || !j["tools"].is_object()) {
        return;
    }

    auto& tools = j["tools"];
    if (!tools.contains("exec") || !tools["exec"].is_object()) {
        return;
    }

    // tools.exec.restrict_to_workspace -> tools.restrict_to_workspace
    auto& exec = tools["exec"];
    if (exec.contains("restrict_to_workspace")) {
        if (!tools.contains("restrict_to_workspace")) {
            tools["restrict_to_workspace"] = exec["restrict_to_workspace"];
            LOG_WARN("Config: tools.exec.restrict_to_workspace is deprecated, "
                     "use tools.restrict_to_workspace");
        }
        exec.erase("restrict_to_workspace");
    }
}

auto validate_config(const Config& config) -> VoidResult {
    const auto& exec = config.tools.exec;

    if (exec.timeout <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "tools.exec.timeout must be positive",
            std::to_string(exec.timeout)));
    }
    if (exec.max_output_chars <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "tools.exec.max_output_chars must be positive"));
    }
    if (exec.kill_grace_seconds < 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "tools.exec.kill_grace_seconds must not be negative",
            std::to_string(exec.kill_grace_seconds)));
    }
    if (exec.shell.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "tools.exec.shell must not be empty"));
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (input.substr(i).starts_with("$${")) {
            result += '$';
            i += 2;
            continue;
        }

        if (input.substr(i).starts_with("${")) {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace shellguard
