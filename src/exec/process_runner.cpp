#include "shellguard/exec/process_runner.hpp"

#include "shellguard/core/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace shellguard::exec {

namespace fs = std::filesystem;
namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

// ---------------------------------------------------------------------------
// Platform helpers
// ---------------------------------------------------------------------------

auto kill_process_group(pid_t pgid, int signal) -> bool {
    if (pgid <= 0) {
        return false;
    }
    if (::kill(-pgid, signal) == 0) {
        return true;
    }
    if (errno == ESRCH) {
        // Already gone: the group has nothing left to stop.
        return true;
    }
    LOG_WARN("kill(-{}, {}) failed: {}", pgid, signal, std::strerror(errno));
    return false;
}

auto exit_code_from_status(int status) -> int {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr auto kFirstPoll = std::chrono::milliseconds(1);
constexpr auto kMaxPoll = std::chrono::milliseconds(50);

/// Owning file descriptor.
class UniqueFd {
public:
    explicit UniqueFd(int fd = -1) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }

    auto release() noexcept -> int {
        return std::exchange(fd_, -1);
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

auto make_pipe() -> Result<Pipe> {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(make_error(ErrorCode::SpawnFailed, "Failed to create pipe",
                                          std::strerror(errno)));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

/// Kills and reaps the child's group unless released. Covers the coroutine
/// frame being destroyed while the child is still running.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) noexcept : pid_(pid) {}
    ~ChildGuard() {
        if (pid_ > 0) {
            kill_process_group(pid_, SIGKILL);
            int status = 0;
            ::waitpid(pid_, &status, WNOHANG);
        }
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    void release() noexcept { pid_ = -1; }

private:
    pid_t pid_;
};

struct Child {
    pid_t pid = -1;
    UniqueFd out;
    UniqueFd err;
    UniqueFd status;  // closed by exec; carries errno if chdir/exec failed
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const char* shell, const char* command, const char* cwd,
                             int out_fd, int err_fd, int status_fd) {
    ::setsid();

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        ::close(null_fd);
    }
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    if (::chdir(cwd) != 0) {
        int code = errno;
        [[maybe_unused]] auto n = ::write(status_fd, &code, sizeof(code));
        ::_exit(127);
    }

    ::execl(shell, "sh", "-c", command, static_cast<char*>(nullptr));

    int code = errno;
    [[maybe_unused]] auto n = ::write(status_fd, &code, sizeof(code));
    ::_exit(127);
}

auto spawn_child(const std::string& shell, const std::string& command,
                 const fs::path& cwd) -> Result<Child> {
    auto out = make_pipe();
    if (!out) return std::unexpected(out.error());
    auto err = make_pipe();
    if (!err) return std::unexpected(err.error());
    auto status = make_pipe();
    if (!status) return std::unexpected(status.error());

    const std::string cwd_str = cwd.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(make_error(ErrorCode::SpawnFailed, "Failed to fork",
                                          std::strerror(errno)));
    }

    if (pid == 0) {
        exec_child(shell.c_str(), command.c_str(), cwd_str.c_str(),
                   out->write.get(), err->write.get(), status->write.get());
    }

    Child child;
    child.pid = pid;
    child.out = std::move(out->read);
    child.err = std::move(err->read);
    child.status = std::move(status->read);
    return child;
}

/// Shared between the run coroutine and its two drain coroutines.
struct Capture {
    Capture(const net::any_io_executor& ex, std::size_t limit)
        : out_pipe(ex), err_pipe(ex), drained(ex), outcome(limit) {}

    net::posix::stream_descriptor out_pipe;
    net::posix::stream_descriptor err_pipe;
    net::steady_timer drained;  // cancelled once both pipes reach EOF
    int pending = 2;
    RunOutcome outcome;

    void close_pipes() {
        boost::system::error_code ignored;
        out_pipe.close(ignored);
        err_pipe.close(ignored);
    }
};

auto drain(std::shared_ptr<Capture> cap, net::posix::stream_descriptor& pipe,
           CapturedStream& sink) -> awaitable<void> {
    std::array<char, kReadChunk> buf{};
    for (;;) {
        boost::system::error_code ec;
        auto n = co_await pipe.async_read_some(net::buffer(buf),
                                               net::redirect_error(net::use_awaitable, ec));
        if (n > 0) {
            sink.append(std::string_view(buf.data(), n));
        }
        if (ec) {
            if (ec != net::error::eof && ec != net::error::operation_aborted) {
                LOG_WARN("Reading child output failed: {}", ec.message());
            }
            break;
        }
    }

    if (--cap->pending == 0) {
        cap->drained.cancel();
    }
}

/// Polls waitpid with backoff until the child exits or `deadline` passes.
/// Returns the wait status, or nullopt on deadline.
auto reap_until(pid_t pid, Clock::time_point deadline, net::steady_timer& timer)
    -> awaitable<std::optional<int>> {
    auto interval = std::chrono::duration_cast<Clock::duration>(kFirstPoll);
    for (;;) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            co_return status;
        }
        if (r < 0 && errno == EINTR) {
            continue;
        }
        if (r < 0) {
            // Reaped elsewhere (e.g. SIGCHLD ignored); the exit status is lost.
            LOG_WARN("waitpid({}) failed: {}", pid, std::strerror(errno));
            co_return 0;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            co_return std::nullopt;
        }

        timer.expires_after(std::min<Clock::duration>(interval, deadline - now));
        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        interval = std::min<Clock::duration>(interval * 2, kMaxPoll);
    }
}

} // namespace

ProcessRunner::ProcessRunner(RunnerOptions options) : options_(std::move(options)) {}

auto ProcessRunner::run(std::string command, fs::path working_dir) const
    -> awaitable<Result<RunOutcome>> {
    auto executor = co_await net::this_coro::executor;

    std::error_code fs_ec;
    if (!fs::is_directory(working_dir, fs_ec)) {
        co_return make_fail(make_error(ErrorCode::SpawnFailed,
                                       "Working directory does not exist",
                                       working_dir.string()));
    }

    auto child = spawn_child(options_.shell, command, working_dir);
    if (!child) {
        LOG_ERROR("Spawn failed: {}", child.error().what());
        co_return make_fail(child.error());
    }

    const pid_t pid = child->pid;
    ChildGuard guard(pid);

    // EOF on the status pipe means exec succeeded; an int means it did not.
    {
        net::posix::stream_descriptor status_pipe(executor, child->status.release());
        int child_errno = 0;
        boost::system::error_code ec;
        auto n = co_await net::async_read(status_pipe,
                                          net::buffer(&child_errno, sizeof(child_errno)),
                                          net::redirect_error(net::use_awaitable, ec));
        if (n == sizeof(child_errno)) {
            int status = 0;
            ::waitpid(pid, &status, 0);
            guard.release();
            LOG_ERROR("Spawn failed: {} ({})", std::strerror(child_errno), options_.shell);
            co_return make_fail(make_error(ErrorCode::SpawnFailed,
                                           "Failed to start " + options_.shell,
                                           std::strerror(child_errno)));
        }
    }

    auto cap = std::make_shared<Capture>(executor, options_.max_output_chars);
    cap->outcome.timeout = options_.timeout;
    cap->outcome.state = RunState::Spawned;
    cap->out_pipe.assign(child->out.release());
    cap->err_pipe.assign(child->err.release());

    LOG_DEBUG("Spawned pid {} in {}", pid, working_dir.string());

    const auto deadline = Clock::now() + options_.timeout;

    net::co_spawn(executor, drain(cap, cap->out_pipe, cap->outcome.out), net::detached);
    net::co_spawn(executor, drain(cap, cap->err_pipe, cap->outcome.err), net::detached);

    if (cap->pending > 0) {
        cap->drained.expires_at(deadline);
        boost::system::error_code ec;
        co_await cap->drained.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    net::steady_timer poll_timer(executor);
    std::optional<int> status;
    if (cap->pending == 0) {
        status = co_await reap_until(pid, deadline, poll_timer);
    }

    auto& outcome = cap->outcome;
    if (status) {
        guard.release();
        outcome.state = RunState::Completed;
        outcome.exit_code = exit_code_from_status(*status);
        LOG_DEBUG("pid {} exited with {} (stdout {} bytes, stderr {} bytes)", pid,
                  outcome.exit_code, outcome.out.total_bytes(), outcome.err.total_bytes());
    } else {
        outcome.state = RunState::TimedOut;
        outcome.timed_out = true;
        LOG_WARN("Command timed out after {}s, killing process group {}",
                 options_.timeout.count(), pid);

        kill_process_group(pid, SIGKILL);
        outcome.state = RunState::Signaled;
        cap->close_pipes();

        auto reaped = co_await reap_until(pid, Clock::now() + options_.kill_grace, poll_timer);
        if (reaped) {
            guard.release();
            outcome.state = RunState::Reaped;
        } else {
            outcome.state = RunState::GraceExpired;
            LOG_WARN("Process group {} did not exit within {}s of SIGKILL", pid,
                     options_.kill_grace.count());
        }
    }

    RunOutcome result = std::move(cap->outcome);
    cap->close_pipes();
    result.state = RunState::Reported;
    co_return std::move(result);
}

} // namespace shellguard::exec
