#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "shellguard/core/config.hpp"
#include "shellguard/core/error.hpp"

namespace shellguard::guard {

/// A compiled, case-insensitive pattern plus the label used in logs.
struct PatternRule {
    std::string label;
    std::string source;
    std::regex matcher;

    [[nodiscard]] auto matches(std::string_view text) const -> bool;
};

/// (label, pattern) pair for the built-in deny set.
struct PatternSpec {
    std::string_view label;
    std::string_view pattern;
};

/// The built-in deny set, in evaluation order.
[[nodiscard]] auto default_deny_specs() -> const std::vector<PatternSpec>&;

/// Compiles one pattern (ECMAScript, case-insensitive).
/// Fails with InvalidConfig when the expression does not compile.
auto compile_rule(std::string label, std::string source) -> Result<PatternRule>;

/// Immutable command policy. Built once from configuration and shared
/// read-only (usually through `std::shared_ptr<const Policy>`) by every
/// guard evaluation.
class Policy {
public:
    /// Compiles the configured patterns. A null or empty deny list selects
    /// the built-in set; an empty allow list disables allow-listing.
    static auto from_config(const ExecConfig& exec, bool restrict_to_workspace)
        -> Result<Policy>;

    /// Built-in deny set, no allow-list, no workspace restriction.
    static auto defaults() -> Policy;

    [[nodiscard]] auto deny_rules() const noexcept -> const std::vector<PatternRule>& {
        return deny_;
    }
    [[nodiscard]] auto allow_rules() const noexcept -> const std::vector<PatternRule>& {
        return allow_;
    }
    [[nodiscard]] auto restrict_to_workspace() const noexcept -> bool {
        return restrict_to_workspace_;
    }
    [[nodiscard]] auto timeout() const noexcept -> std::chrono::seconds { return timeout_; }
    [[nodiscard]] auto working_dir() const noexcept
        -> const std::optional<std::filesystem::path>& {
        return working_dir_;
    }

    /// First deny rule matching `lowered`, or nullptr.
    [[nodiscard]] auto find_denied(std::string_view lowered) const -> const PatternRule*;

    /// True when no allow-list is configured or any allow rule matches.
    [[nodiscard]] auto is_allowlisted(std::string_view lowered) const -> bool;

private:
    Policy() = default;

    std::vector<PatternRule> deny_;
    std::vector<PatternRule> allow_;
    bool restrict_to_workspace_ = false;
    std::chrono::seconds timeout_{60};
    std::optional<std::filesystem::path> working_dir_;
};

} // namespace shellguard::guard
