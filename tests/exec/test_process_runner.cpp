#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include "shellguard/exec/process_runner.hpp"

using namespace shellguard::exec;
namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

// Helper to run a coroutine synchronously.
template <typename T>
auto run_sync(boost::asio::awaitable<T> coro) -> T {
    boost::asio::io_context ioc;
    std::optional<T> result;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            result.emplace(co_await std::move(coro));
        },
        boost::asio::detached);
    ioc.run();
    REQUIRE(result.has_value());
    return std::move(*result);
}

auto make_runner(std::chrono::seconds timeout = std::chrono::seconds(10),
                 std::size_t max_output_chars = 10000) -> ProcessRunner {
    RunnerOptions options;
    options.timeout = timeout;
    options.kill_grace = std::chrono::seconds(2);
    options.max_output_chars = max_output_chars;
    return ProcessRunner(options);
}

auto tmp_dir() -> fs::path {
    return fs::canonical(fs::temp_directory_path());
}

/// True while `pid` exists and is not a zombie.
auto is_running(pid_t pid) -> bool {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) return false;
    std::string line;
    std::getline(stat, line);
    auto paren = line.rfind(')');
    if (paren == std::string::npos || paren + 2 >= line.size()) return false;
    char state = line[paren + 2];
    return state != 'Z' && state != 'X';
}

auto wait_until_gone(pid_t pid, std::chrono::milliseconds budget) -> bool {
    auto deadline = Clock::now() + budget;
    while (Clock::now() < deadline) {
        if (!is_running(pid)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return !is_running(pid);
}

} // namespace

// ---------------------------------------------------------------------------
// Normal completion
// ---------------------------------------------------------------------------

TEST_CASE("ProcessRunner captures stdout", "[exec][runner]") {
    auto runner = make_runner();
    auto result = run_sync(runner.run("printf 'hello'", tmp_dir()));

    REQUIRE(result.has_value());
    CHECK(result->out.text() == "hello");
    CHECK(result->err.empty());
    CHECK(result->exit_code == 0);
    CHECK_FALSE(result->timed_out);
    CHECK(result->state == RunState::Reported);
}

TEST_CASE("ProcessRunner captures stderr and exit code separately", "[exec][runner]") {
    auto runner = make_runner();
    auto result = run_sync(runner.run("echo out; echo err 1>&2; exit 3", tmp_dir()));

    REQUIRE(result.has_value());
    CHECK(result->out.text() == "out\n");
    CHECK(result->err.text() == "err\n");
    CHECK(result->exit_code == 3);

    auto rendered = render_outcome(*result, 10000);
    CHECK(rendered.text == "out\n\nSTDERR:\nerr\n\n\nExit code: 3");
}

TEST_CASE("ProcessRunner runs in the working directory", "[exec][runner]") {
    auto dir = tmp_dir() / "shellguard_runner_cwd";
    fs::create_directories(dir);

    auto runner = make_runner();
    auto result = run_sync(runner.run("pwd -P", dir));

    REQUIRE(result.has_value());
    CHECK(result->out.text() == dir.string() + "\n");

    fs::remove_all(dir);
}

TEST_CASE("ProcessRunner gives the child an empty stdin", "[exec][runner]") {
    auto runner = make_runner(std::chrono::seconds(5));
    auto start = Clock::now();
    auto result = run_sync(runner.run("cat", tmp_dir()));

    REQUIRE(result.has_value());
    CHECK_FALSE(result->timed_out);
    CHECK(result->out.empty());
    CHECK(Clock::now() - start < std::chrono::seconds(4));
}

TEST_CASE("ProcessRunner reports signal deaths as negative codes", "[exec][runner]") {
    auto runner = make_runner();
    auto result = run_sync(runner.run("kill -9 $$", tmp_dir()));

    REQUIRE(result.has_value());
    CHECK(result->exit_code == -SIGKILL);
    CHECK_FALSE(result->timed_out);
}

TEST_CASE("ProcessRunner drains both pipes concurrently", "[exec][runner]") {
    // More than a pipe buffer on each stream; sequential reads would deadlock.
    auto runner = make_runner(std::chrono::seconds(10), 1000);
    auto result = run_sync(runner.run(
        "head -c 200000 /dev/zero; head -c 200000 /dev/zero 1>&2", tmp_dir()));

    REQUIRE(result.has_value());
    CHECK_FALSE(result->timed_out);
    CHECK(result->out.total_bytes() == 200000);
    CHECK(result->err.total_bytes() == 200000);
    CHECK(result->out.text().size() == 1000);
}

// ---------------------------------------------------------------------------
// Truncation
// ---------------------------------------------------------------------------

TEST_CASE("ProcessRunner output is truncated with an exact count", "[exec][runner]") {
    auto runner = make_runner(std::chrono::seconds(10), 1000);
    auto result = run_sync(runner.run("head -c 50000 /dev/zero | tr '\\0' 'a'", tmp_dir()));

    REQUIRE(result.has_value());
    auto rendered = render_outcome(*result, 1000);
    CHECK(rendered.truncated);
    CHECK(rendered.omitted == 49000);
    CHECK(rendered.text == std::string(1000, 'a') + "\n... (truncated, 49000 more chars)");
}

// ---------------------------------------------------------------------------
// Timeout
// ---------------------------------------------------------------------------

TEST_CASE("ProcessRunner kills the whole process group on timeout", "[exec][runner][timeout]") {
    auto dir = tmp_dir() / "shellguard_runner_timeout";
    fs::create_directories(dir);
    auto pid_file = dir / "bg.pid";

    auto runner = make_runner(std::chrono::seconds(1));
    auto start = Clock::now();
    auto result = run_sync(runner.run(
        "sleep 30 & echo $! > " + pid_file.string() + "; sleep 30", dir));
    auto elapsed = Clock::now() - start;

    REQUIRE(result.has_value());
    CHECK(result->timed_out);
    CHECK(result->state == RunState::Reported);
    CHECK(elapsed < std::chrono::seconds(10));
    CHECK(render_outcome(*result, 10000).text == "Error: Command timed out after 1 seconds");

    // The background sleep shares the group and must be gone too.
    std::ifstream in(pid_file);
    pid_t background = 0;
    in >> background;
    REQUIRE(background > 0);
    CHECK(wait_until_gone(background, std::chrono::milliseconds(2000)));

    fs::remove_all(dir);
}

TEST_CASE("ProcessRunner times out on a child holding its pipes open", "[exec][runner][timeout]") {
    auto runner = make_runner(std::chrono::seconds(1));
    auto result = run_sync(runner.run("sleep 30 & echo started", tmp_dir()));

    REQUIRE(result.has_value());
    CHECK(result->timed_out);
}

// ---------------------------------------------------------------------------
// Spawn failures
// ---------------------------------------------------------------------------

TEST_CASE("ProcessRunner reports spawn failures as errors", "[exec][runner]") {
    SECTION("missing shell") {
        RunnerOptions options;
        options.shell = "/nonexistent/shell";
        ProcessRunner runner(options);

        auto result = run_sync(runner.run("echo hi", tmp_dir()));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == shellguard::ErrorCode::SpawnFailed);
        CHECK(result.error().message() == "Failed to start /nonexistent/shell");
    }

    SECTION("missing working directory") {
        auto runner = make_runner();
        auto result = run_sync(runner.run("echo hi", "/nonexistent/dir/for/shellguard"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == shellguard::ErrorCode::SpawnFailed);
        CHECK(result.error().message() == "Working directory does not exist");
    }
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------

TEST_CASE("ProcessRunner invocations run concurrently", "[exec][runner]") {
    auto runner = make_runner();
    boost::asio::io_context ioc;
    std::vector<std::string> outputs(3);

    auto start = Clock::now();
    for (int i = 0; i < 3; ++i) {
        boost::asio::co_spawn(ioc,
            [&, i]() -> boost::asio::awaitable<void> {
                auto result = co_await runner.run("sleep 1; echo " + std::to_string(i),
                                                  tmp_dir());
                if (result) outputs[i] = result->out.text();
            },
            boost::asio::detached);
    }
    ioc.run();
    auto elapsed = Clock::now() - start;

    CHECK(outputs[0] == "0\n");
    CHECK(outputs[1] == "1\n");
    CHECK(outputs[2] == "2\n");
    CHECK(elapsed < std::chrono::milliseconds(2500));
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

TEST_CASE("kill_process_group treats a vanished group as success", "[exec][runner]") {
    pid_t pid = ::fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        ::_exit(0);
    }
    int status = 0;
    REQUIRE(::waitpid(pid, &status, 0) == pid);

    CHECK(kill_process_group(pid, SIGKILL));
    CHECK_FALSE(kill_process_group(0, SIGKILL));
}

TEST_CASE("exit_code_from_status", "[exec][runner]") {
    CHECK(exit_code_from_status(0) == 0);
    CHECK(exit_code_from_status(3 << 8) == 3);
    CHECK(exit_code_from_status(SIGKILL) == -SIGKILL);
}
