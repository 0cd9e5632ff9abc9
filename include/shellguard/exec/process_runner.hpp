#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

#include <sys/types.h>

#include <boost/asio/awaitable.hpp>

#include "shellguard/core/error.hpp"
#include "shellguard/exec/run_outcome.hpp"

namespace shellguard::exec {

using boost::asio::awaitable;

struct RunnerOptions {
    std::chrono::seconds timeout{60};
    std::chrono::seconds kill_grace{5};
    std::size_t max_output_chars = 10000;
    std::string shell = "/bin/sh";
};

/// Runs shell commands as children in their own session and process group.
///
/// stdout and stderr are drained concurrently through Asio descriptors on
/// the calling coroutine's executor, so waiting never blocks the thread.
/// A single deadline covers draining and reaping. When it passes, the whole
/// group gets SIGKILL and the child is reaped within the grace period; a
/// child that still has not exited by then is logged and left behind.
///
/// Each call owns its pipes, timers and child; the per-call state must be
/// driven by one thread at a time (a single-threaded io_context or a strand).
/// Destroying a suspended call kills its process group.
class ProcessRunner {
public:
    explicit ProcessRunner(RunnerOptions options);

    /// Fails only when the child cannot be started (pipes, fork, chdir or exec
    /// of the shell). Non-zero exits and timeouts are reported in the outcome.
    auto run(std::string command, std::filesystem::path working_dir) const
        -> awaitable<Result<RunOutcome>>;

    [[nodiscard]] auto options() const noexcept -> const RunnerOptions& { return options_; }

private:
    RunnerOptions options_;
};

/// Sends `signal` to every process in group `pgid`. A group that no longer
/// exists counts as success.
auto kill_process_group(pid_t pgid, int signal) -> bool;

/// Converts a waitpid status to an exit code; signal deaths are negative.
auto exit_code_from_status(int status) -> int;

} // namespace shellguard::exec
