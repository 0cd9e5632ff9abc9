#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shellguard/guard/policy.hpp"

namespace shellguard::guard {

enum class RejectReason {
    DeniedPattern,
    NotAllowlisted,
    PathTraversal,
    OutsideWorkingDirectory,
    CommandTooLong,
};

/// Longest command, after trimming, that the guard will evaluate. Longer
/// input is rejected before any pattern runs: std::regex matching recurses
/// per character and would overflow the stack.
inline constexpr std::size_t kMaxCommandLength = 8192;

auto reject_reason_to_string(RejectReason reason) -> std::string_view;

/// Outcome of a guard evaluation. `reason` is empty for Permit; `detail`
/// names the matched rule or the offending path.
struct GuardDecision {
    std::optional<RejectReason> reason;
    std::string detail;

    static auto permit() -> GuardDecision { return {}; }
    static auto reject(RejectReason why, std::string detail) -> GuardDecision {
        return GuardDecision{why, std::move(detail)};
    }

    [[nodiscard]] auto permitted() const noexcept -> bool { return !reason.has_value(); }
};

/// Caller-facing text for a rejection, e.g.
/// "Error: Command blocked by safety guard (dangerous pattern detected)".
auto rejection_message(RejectReason reason) -> std::string;

/// Best-effort textual guard in front of the process runner.
///
/// Evaluation order, stopping at the first rejection:
///   0. reject commands longer than kMaxCommandLength;
///   1. normalize ANSI-C quoting, trim, lower-case;
///   2. deny rules;
///   3. allow rules (only when configured);
///   4. workspace confinement (only when enabled): traversal tokens in the
///      literal and percent-decoded text, then absolute paths that resolve
///      outside the working directory.
///
/// This is pattern matching over a string, not a shell parser: quoting,
/// variables and indirection can defeat it. It narrows what an agent can
/// run; it does not make arbitrary input safe. Evaluation is const and
/// touches nothing but the filesystem metadata needed to resolve paths.
class CommandGuard {
public:
    explicit CommandGuard(std::shared_ptr<const Policy> policy);

    [[nodiscard]] auto evaluate(std::string_view command,
                                const std::filesystem::path& working_dir) const
        -> GuardDecision;

    [[nodiscard]] auto policy() const noexcept -> const Policy& { return *policy_; }

private:
    [[nodiscard]] auto check_workspace(std::string_view normalized,
                                       const std::filesystem::path& working_dir) const
        -> GuardDecision;

    std::shared_ptr<const Policy> policy_;
};

/// True if `text` or its percent-decoded form contains `../` or `..\`.
[[nodiscard]] auto contains_path_traversal(std::string_view text) -> bool;

/// Absolute paths mentioned in a command: POSIX paths preceded by start of
/// text, whitespace, a shell operator (`| < > ; & (`), a quote or `=`, then
/// Windows drive-letter paths.
[[nodiscard]] auto extract_absolute_paths(std::string_view text) -> std::vector<std::string>;

/// True if `candidate` equals `root` or lies beneath it. Both must already be
/// normalised absolute paths.
[[nodiscard]] auto is_within_directory(const std::filesystem::path& root,
                                       const std::filesystem::path& candidate) -> bool;

} // namespace shellguard::guard
