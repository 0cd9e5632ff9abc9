#include "shellguard/exec/run_outcome.hpp"

#include "shellguard/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace shellguard::exec {

auto run_state_to_string(RunState state) -> std::string_view {
    switch (state) {
        case RunState::Created: return "created";
        case RunState::Spawned: return "spawned";
        case RunState::Completed: return "completed";
        case RunState::TimedOut: return "timed_out";
        case RunState::Signaled: return "signaled";
        case RunState::Reaped: return "reaped";
        case RunState::GraceExpired: return "grace_expired";
        case RunState::Reported: return "reported";
        default: return "unknown";
    }
}

void CapturedStream::append(std::string_view chunk) {
    total_ += chunk.size();

    if (!has_content_) {
        has_content_ = std::any_of(chunk.begin(), chunk.end(), [](unsigned char c) {
            return std::isspace(c) == 0;
        });
    }

    if (text_.size() < limit_) {
        auto room = limit_ - text_.size();
        text_.append(chunk.substr(0, std::min(room, chunk.size())));
    }
}

namespace {

struct Part {
    std::string prefix;
    const CapturedStream* stream = nullptr;  // null for fixed text parts

    [[nodiscard]] auto full_length() const -> std::size_t {
        return prefix.size() + (stream ? stream->total_bytes() : 0);
    }
};

} // namespace

auto render_outcome(const RunOutcome& outcome, std::size_t max_chars) -> RenderedOutput {
    if (outcome.timed_out) {
        return RenderedOutput{
            "Error: Command timed out after " + std::to_string(outcome.timeout.count()) +
                " seconds",
            false, 0};
    }

    std::vector<Part> parts;
    if (!outcome.out.empty()) {
        parts.push_back(Part{"", &outcome.out});
    }
    if (outcome.err.has_content()) {
        parts.push_back(Part{"STDERR:\n", &outcome.err});
    }
    if (outcome.exit_code != 0) {
        parts.push_back(Part{"\nExit code: " + std::to_string(outcome.exit_code), nullptr});
    }

    if (parts.empty()) {
        return RenderedOutput{"(no output)", false, 0};
    }

    // The length of the text as if nothing had been dropped during capture.
    std::size_t full_length = parts.size() - 1;
    for (const auto& part : parts) {
        full_length += part.full_length();
    }

    // Each stream keeps at least `max_chars` bytes, so the first `max_chars`
    // bytes of this materialised text equal those of the full text.
    std::string text;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) text += '\n';
        text += parts[i].prefix;
        if (parts[i].stream) text += parts[i].stream->text();
    }

    if (full_length <= max_chars) {
        return RenderedOutput{utils::sanitize_utf8(text), false, 0};
    }

    // Never cut inside a multibyte character.
    auto kept = utils::utf8_floor(text, max_chars);
    auto omitted = full_length - kept;
    text.resize(kept);
    auto rendered = utils::sanitize_utf8(text);
    rendered += "\n... (truncated, " + std::to_string(omitted) + " more chars)";
    return RenderedOutput{std::move(rendered), true, omitted};
}

} // namespace shellguard::exec
