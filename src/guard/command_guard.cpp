#include "shellguard/guard/command_guard.hpp"

#include "shellguard/core/logger.hpp"
#include "shellguard/core/utils.hpp"
#include "shellguard/guard/normalizer.hpp"

#include <cctype>
#include <system_error>

namespace shellguard::guard {

namespace fs = std::filesystem;

auto reject_reason_to_string(RejectReason reason) -> std::string_view {
    switch (reason) {
        case RejectReason::DeniedPattern: return "dangerous pattern detected";
        case RejectReason::NotAllowlisted: return "not in allowlist";
        case RejectReason::PathTraversal: return "path traversal detected";
        case RejectReason::OutsideWorkingDirectory: return "path outside working dir";
        case RejectReason::CommandTooLong: return "command too long";
        default: return "blocked";
    }
}

auto rejection_message(RejectReason reason) -> std::string {
    return "Error: Command blocked by safety guard (" +
           std::string(reject_reason_to_string(reason)) + ")";
}

namespace {

auto drop_trailing_separator(fs::path p) -> fs::path {
    if (!p.has_filename() && p.has_relative_path()) {
        return p.parent_path();
    }
    return p;
}

/// Symlink-aware, non-strict canonical form of an absolute path.
auto resolve_path(const fs::path& p) -> std::optional<fs::path> {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(p, ec);
    if (ec) {
        return std::nullopt;
    }
    return drop_trailing_separator(resolved.lexically_normal());
}

auto resolve_working_dir(const fs::path& working_dir) -> fs::path {
    if (auto resolved = resolve_path(working_dir)) {
        return *resolved;
    }
    std::error_code ec;
    auto absolute = fs::absolute(working_dir, ec);
    return drop_trailing_separator((ec ? working_dir : absolute).lexically_normal());
}

auto is_drive_letter_path(std::string_view raw) -> bool {
    return raw.size() >= 3 && std::isalpha(static_cast<unsigned char>(raw[0])) &&
           raw[1] == ':' && raw[2] == '\\';
}

auto is_one_of(char c, std::string_view set) -> bool {
    return set.find(c) != std::string_view::npos;
}

// A POSIX path starts at a '/' that follows a shell separator, a quote or
// an option's '='. A letter or '.' before it means a relative path
// (".venv/bin/python") or a URL.
auto starts_posix_path(std::string_view text, std::size_t i) -> bool {
    if (text[i] != '/') return false;
    if (i == 0) return true;
    char prev = text[i - 1];
    return std::isspace(static_cast<unsigned char>(prev)) || is_one_of(prev, "|<>;&(\"'=");
}

auto ends_posix_path(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) || is_one_of(c, "\"'<>|;&)");
}

auto starts_drive_path(std::string_view text, std::size_t i) -> bool {
    return i + 3 < text.size() && std::isalpha(static_cast<unsigned char>(text[i])) &&
           text[i + 1] == ':' && text[i + 2] == '\\' && !is_one_of(text[i + 3], "\\\"'");
}

} // namespace

auto contains_path_traversal(std::string_view text) -> bool {
    auto has_token = [](std::string_view s) {
        return s.find("../") != std::string_view::npos ||
               s.find("..\\") != std::string_view::npos;
    };
    return has_token(text) || has_token(utils::percent_decode(text));
}

auto extract_absolute_paths(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> paths;

    for (std::size_t i = 0; i < text.size();) {
        if (!starts_posix_path(text, i)) {
            ++i;
            continue;
        }
        auto end = i;
        while (end < text.size() && !ends_posix_path(text[end])) ++end;
        paths.emplace_back(text.substr(i, end - i));
        i = end;
    }

    // A drive path runs to the next backslash or quote.
    for (std::size_t i = 0; i < text.size();) {
        if (!starts_drive_path(text, i)) {
            ++i;
            continue;
        }
        auto end = i + 3;
        while (end < text.size() && !is_one_of(text[end], "\\\"'")) ++end;
        paths.push_back(utils::trim(text.substr(i, end - i)));
        i = end;
    }
    return paths;
}

auto is_within_directory(const fs::path& root, const fs::path& candidate) -> bool {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end() && cand_it != candidate.end(); ++root_it, ++cand_it) {
        if (*root_it != *cand_it) {
            return false;
        }
    }
    return root_it == root.end();
}

CommandGuard::CommandGuard(std::shared_ptr<const Policy> policy)
    : policy_(std::move(policy)) {}

auto CommandGuard::evaluate(std::string_view command, const fs::path& working_dir) const
    -> GuardDecision {
    auto trimmed = utils::trim(command);
    if (trimmed.size() > kMaxCommandLength) {
        LOG_WARN("Command rejected: {} bytes exceeds the {} byte limit", trimmed.size(),
                 kMaxCommandLength);
        return GuardDecision::reject(RejectReason::CommandTooLong,
                                     std::to_string(trimmed.size()));
    }

    auto normalized = normalize_command(trimmed);
    auto lowered = utils::to_lower(normalized);

    LOG_DEBUG("Guard evaluating: {}", lowered);

    if (const auto* rule = policy_->find_denied(lowered)) {
        LOG_WARN("Command rejected: deny rule '{}' matched", rule->label);
        return GuardDecision::reject(RejectReason::DeniedPattern, rule->label);
    }

    if (!policy_->is_allowlisted(lowered)) {
        LOG_WARN("Command rejected: no allow rule matched");
        return GuardDecision::reject(RejectReason::NotAllowlisted, {});
    }

    if (policy_->restrict_to_workspace()) {
        return check_workspace(normalized, working_dir);
    }

    return GuardDecision::permit();
}

auto CommandGuard::check_workspace(std::string_view normalized,
                                   const fs::path& working_dir) const -> GuardDecision {
    if (contains_path_traversal(normalized)) {
        LOG_WARN("Command rejected: path traversal token");
        return GuardDecision::reject(RejectReason::PathTraversal, {});
    }

    auto root = resolve_working_dir(working_dir);

    for (const auto& raw : extract_absolute_paths(normalized)) {
        // A drive-letter path cannot live under a POSIX working directory.
        if (is_drive_letter_path(raw) && !root.has_root_name()) {
            LOG_WARN("Command rejected: drive path {} outside {}", raw, root.string());
            return GuardDecision::reject(RejectReason::OutsideWorkingDirectory, raw);
        }

        // Anything that cannot be resolved is treated as outside.
        auto resolved = resolve_path(fs::path(raw));
        if (!resolved || (resolved->is_absolute() && !is_within_directory(root, *resolved))) {
            LOG_WARN("Command rejected: path {} outside {}", raw, root.string());
            return GuardDecision::reject(RejectReason::OutsideWorkingDirectory, raw);
        }
    }

    return GuardDecision::permit();
}

} // namespace shellguard::guard
