#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace shellguard::exec {

/// Lifecycle of one runner invocation. Every invocation ends in Reported.
///
///   Created -> Spawned -> Completed                              -> Reported
///                      -> TimedOut -> Signaled -> Reaped         -> Reported
///                                              -> GraceExpired   -> Reported
enum class RunState {
    Created,
    Spawned,
    Completed,
    TimedOut,
    Signaled,
    Reaped,
    GraceExpired,
    Reported,
};

auto run_state_to_string(RunState state) -> std::string_view;

/// Output of one stream, holding at most `limit` bytes while still counting
/// everything that was written.
class CapturedStream {
public:
    explicit CapturedStream(std::size_t limit) : limit_(limit) {}

    void append(std::string_view chunk);

    [[nodiscard]] auto text() const noexcept -> const std::string& { return text_; }
    [[nodiscard]] auto total_bytes() const noexcept -> std::size_t { return total_; }
    [[nodiscard]] auto dropped_bytes() const noexcept -> std::size_t {
        return total_ - text_.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool { return total_ == 0; }

    /// True if anything other than whitespace was written, including bytes
    /// past the limit.
    [[nodiscard]] auto has_content() const noexcept -> bool { return has_content_; }

private:
    std::size_t limit_;
    std::string text_;
    std::size_t total_ = 0;
    bool has_content_ = false;
};

struct RunOutcome {
    explicit RunOutcome(std::size_t capture_limit)
        : out(capture_limit), err(capture_limit) {}

    CapturedStream out;
    CapturedStream err;
    int exit_code = 0;          // negative signal number when killed by a signal
    bool timed_out = false;
    std::chrono::seconds timeout{0};
    RunState state = RunState::Created;
};

struct RenderedOutput {
    std::string text;
    bool truncated = false;
    std::size_t omitted = 0;
};

/// Renders an outcome as the text handed back to the agent: stdout, then
/// "STDERR:\n..." when stderr is not blank, then "\nExit code: N" when
/// non-zero, joined by newlines ("(no output)" when all are absent). Text
/// longer than `max_chars` is cut and followed by
/// "\n... (truncated, M more chars)"; the cut moves back to a character
/// boundary and M counts bytes. Malformed UTF-8 in the output becomes U+FFFD.
/// A timed-out outcome renders as "Error: Command timed out after N seconds".
[[nodiscard]] auto render_outcome(const RunOutcome& outcome, std::size_t max_chars)
    -> RenderedOutput;

} // namespace shellguard::exec
