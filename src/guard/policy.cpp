#include "shellguard/guard/policy.hpp"

#include "shellguard/core/logger.hpp"

#include <algorithm>

namespace shellguard::guard {

auto PatternRule::matches(std::string_view text) const -> bool {
    return std::regex_search(text.begin(), text.end(), matcher);
}

auto default_deny_specs() -> const std::vector<PatternSpec>& {
    static const std::vector<PatternSpec> specs = {
        // Destructive file/disk operations
        {"recursive-delete", R"(\brm\s+-[rf]{1,2}\b)"},
        {"windows-delete", R"(\bdel\s+/[fq]\b)"},
        {"windows-rmdir", R"(\brmdir\s+/s\b)"},
        {"disk-format", R"((?:^|[;&|]\s*)format\b)"},
        {"filesystem-create", R"(\b(mkfs|diskpart)\b)"},
        {"raw-copy", R"(\bdd\s+if=)"},
        {"raw-device-write", R"(>\s*/dev/sd)"},
        {"power-control", R"(\b(shutdown|reboot|poweroff)\b)"},
        {"fork-bomb", R"(:\(\)\s*\{.*\};\s*:)"},
        // Meta-execution
        {"eval", R"(\beval\b)"},
        {"exec", R"(\bexec\b)"},
        {"bash-inline", R"(\bbash\s+-c\b)"},
        {"sh-inline", R"(\bsh\s+-c\b)"},
        {"zsh-inline", R"(\bzsh\s+-c\b)"},
        {"python-inline", R"(\bpython[23]?\s+-c\b)"},
        {"perl-inline", R"(\bperl\s+-e\b)"},
        {"ruby-inline", R"(\bruby\s+-e\b)"},
        {"node-inline", R"(\bnode\s+-e\b)"},
        {"pipe-to-shell", R"(\|\s*(bash|sh|zsh)\b)"},
        {"base64-decode", R"(\bbase64\s+--?d(ecode)?\b)"},
        // Command substitution
        {"dollar-substitution", R"(\$\()"},
        {"backtick-substitution", R"(`)"},
        // Assign-then-expand evasion
        {"export-assignment", R"(\bexport\s+\w+=)"},
    };
    return specs;
}

auto compile_rule(std::string label, std::string source) -> Result<PatternRule> {
    try {
        std::regex matcher(source, std::regex::ECMAScript | std::regex::icase |
                                       std::regex::optimize);
        return PatternRule{std::move(label), std::move(source), std::move(matcher)};
    } catch (const std::regex_error& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Invalid command pattern",
            source + " (" + e.what() + ")"));
    }
}

namespace {

auto compile_list(const std::vector<std::string>& sources, std::string_view label_prefix)
    -> Result<std::vector<PatternRule>> {
    std::vector<PatternRule> rules;
    rules.reserve(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        auto rule = compile_rule(std::string(label_prefix) + "-" + std::to_string(i + 1),
                                 sources[i]);
        if (!rule) {
            return std::unexpected(rule.error());
        }
        rules.push_back(std::move(*rule));
    }
    return rules;
}

auto compile_defaults() -> std::vector<PatternRule> {
    std::vector<PatternRule> rules;
    rules.reserve(default_deny_specs().size());
    for (const auto& spec : default_deny_specs()) {
        // Built-in patterns are known-good; a failure here is a programming error
        // surfaced by the policy tests.
        auto rule = compile_rule(std::string(spec.label), std::string(spec.pattern));
        if (!rule) {
            LOG_ERROR("Built-in deny pattern failed to compile: {}", rule.error().what());
            continue;
        }
        rules.push_back(std::move(*rule));
    }
    return rules;
}

} // namespace

auto Policy::from_config(const ExecConfig& exec, bool restrict_to_workspace)
    -> Result<Policy> {
    Policy policy;

    if (exec.deny_patterns && !exec.deny_patterns->empty()) {
        auto deny = compile_list(*exec.deny_patterns, "deny");
        if (!deny) {
            return std::unexpected(deny.error());
        }
        policy.deny_ = std::move(*deny);
    } else {
        policy.deny_ = compile_defaults();
    }

    auto allow = compile_list(exec.allow_patterns, "allow");
    if (!allow) {
        return std::unexpected(allow.error());
    }
    policy.allow_ = std::move(*allow);

    policy.restrict_to_workspace_ = restrict_to_workspace;
    policy.timeout_ = std::chrono::seconds(exec.timeout);
    if (exec.working_dir && !exec.working_dir->empty()) {
        policy.working_dir_ = std::filesystem::path(*exec.working_dir);
    }

    LOG_INFO("Command policy ready: {} deny rules, {} allow rules, workspace restriction {}",
             policy.deny_.size(), policy.allow_.size(),
             policy.restrict_to_workspace_ ? "on" : "off");
    return policy;
}

auto Policy::defaults() -> Policy {
    Policy policy;
    policy.deny_ = compile_defaults();
    return policy;
}

auto Policy::find_denied(std::string_view lowered) const -> const PatternRule* {
    auto it = std::find_if(deny_.begin(), deny_.end(),
                           [&](const PatternRule& rule) { return rule.matches(lowered); });
    return it != deny_.end() ? &*it : nullptr;
}

auto Policy::is_allowlisted(std::string_view lowered) const -> bool {
    if (allow_.empty()) return true;
    return std::any_of(allow_.begin(), allow_.end(),
                       [&](const PatternRule& rule) { return rule.matches(lowered); });
}

} // namespace shellguard::guard
