#include <catch2/catch_test_macros.hpp>

#include <string>

#include "shellguard/exec/run_outcome.hpp"

using namespace shellguard::exec;

namespace {

auto outcome_with(std::string out, std::string err, int exit_code,
                  std::size_t limit = 10000) -> RunOutcome {
    RunOutcome outcome(limit);
    outcome.out.append(out);
    outcome.err.append(err);
    outcome.exit_code = exit_code;
    outcome.state = RunState::Completed;
    return outcome;
}

} // namespace

TEST_CASE("CapturedStream bounds memory but counts everything", "[exec][outcome]") {
    CapturedStream stream(4);

    SECTION("below the limit") {
        stream.append("ab");
        CHECK(stream.text() == "ab");
        CHECK(stream.total_bytes() == 2);
        CHECK(stream.dropped_bytes() == 0);
        CHECK_FALSE(stream.empty());
    }

    SECTION("across the limit") {
        stream.append("abc");
        stream.append("defg");
        CHECK(stream.text() == "abcd");
        CHECK(stream.total_bytes() == 7);
        CHECK(stream.dropped_bytes() == 3);
    }

    SECTION("content past the limit still counts as content") {
        stream.append("    ");
        CHECK_FALSE(stream.has_content());
        stream.append("x");
        CHECK(stream.has_content());
        CHECK(stream.text() == "    ");
    }

    SECTION("nothing written") {
        CHECK(stream.empty());
        CHECK_FALSE(stream.has_content());
    }
}

TEST_CASE("render_outcome joins the parts", "[exec][outcome]") {
    SECTION("no output at all") {
        CHECK(render_outcome(outcome_with("", "", 0), 10000).text == "(no output)");
    }

    SECTION("stdout only") {
        CHECK(render_outcome(outcome_with("hello\n", "", 0), 10000).text == "hello\n");
    }

    SECTION("stdout and stderr") {
        CHECK(render_outcome(outcome_with("out", "err", 0), 10000).text ==
              "out\nSTDERR:\nerr");
    }

    SECTION("stderr and exit code") {
        CHECK(render_outcome(outcome_with("", "oops\n", 1), 10000).text ==
              "STDERR:\noops\n\n\nExit code: 1");
    }

    SECTION("exit code only") {
        CHECK(render_outcome(outcome_with("", "", 2), 10000).text == "\nExit code: 2");
    }

    SECTION("signal death reports a negative code") {
        CHECK(render_outcome(outcome_with("", "", -9), 10000).text == "\nExit code: -9");
    }

    SECTION("whitespace-only stderr is dropped") {
        CHECK(render_outcome(outcome_with("out", " \n\t", 0), 10000).text == "out");
        CHECK(render_outcome(outcome_with("", "\n", 0), 10000).text == "(no output)");
    }
}

TEST_CASE("render_outcome reports timeouts", "[exec][outcome]") {
    auto outcome = outcome_with("partial", "", 0);
    outcome.timed_out = true;
    outcome.timeout = std::chrono::seconds(5);

    auto rendered = render_outcome(outcome, 10000);
    CHECK(rendered.text == "Error: Command timed out after 5 seconds");
    CHECK_FALSE(rendered.truncated);
}

TEST_CASE("render_outcome truncates long output", "[exec][outcome]") {
    SECTION("exactly at the cap is not truncated") {
        auto rendered = render_outcome(outcome_with(std::string(10, 'a'), "", 0, 10), 10);
        CHECK(rendered.text == std::string(10, 'a'));
        CHECK_FALSE(rendered.truncated);
    }

    SECTION("stdout over the cap") {
        auto rendered = render_outcome(outcome_with(std::string(25, 'a'), "", 0, 10), 10);
        CHECK(rendered.truncated);
        CHECK(rendered.omitted == 15);
        CHECK(rendered.text == std::string(10, 'a') + "\n... (truncated, 15 more chars)");
    }

    SECTION("omitted count includes labels and bytes never captured") {
        // Full text: "abc\nSTDERR:\n" + 20 x's = 32 chars.
        auto rendered = render_outcome(outcome_with("abc", std::string(20, 'x'), 0, 10), 10);
        CHECK(rendered.truncated);
        CHECK(rendered.omitted == 22);
        CHECK(rendered.text == "abc\nSTDERR\n... (truncated, 22 more chars)");
    }

    SECTION("large output keeps the count exact") {
        auto outcome = outcome_with("", "", 0, 100);
        for (int i = 0; i < 1000; ++i) {
            outcome.out.append(std::string(100, 'z'));
        }
        auto rendered = render_outcome(outcome, 100);
        CHECK(outcome.out.text().size() == 100);
        CHECK(rendered.omitted == 100000 - 100);
        CHECK(rendered.text.starts_with(std::string(100, 'z') + "\n... (truncated, 99900 more chars)"));
    }
}

TEST_CASE("render_outcome emits valid UTF-8", "[exec][outcome]") {
    const std::string replacement = "\xEF\xBF\xBD";

    SECTION("the cut never splits a character") {
        // 9999 ASCII bytes then a two-byte character straddling the cap.
        auto rendered = render_outcome(
            outcome_with(std::string(9999, 'a') + "\xC3\xA9" + "tail", "", 0), 10000);
        CHECK(rendered.truncated);
        CHECK(rendered.omitted == 6);
        CHECK(rendered.text == std::string(9999, 'a') + "\n... (truncated, 6 more chars)");
    }

    SECTION("a character cut by the capture limit is dropped") {
        auto rendered = render_outcome(outcome_with("abc\xE2\x82\xAC", "", 0, 5), 5);
        CHECK(rendered.truncated);
        CHECK(rendered.omitted == 3);
        CHECK(rendered.text == "abc\n... (truncated, 3 more chars)");
    }

    SECTION("malformed bytes are replaced") {
        auto rendered = render_outcome(outcome_with("\xFF\xFE", "", 0), 10000);
        CHECK(rendered.text == replacement + replacement);
    }

    SECTION("stderr is sanitised too") {
        auto rendered = render_outcome(outcome_with("", "bad \xC3", 1), 10000);
        CHECK(rendered.text == "STDERR:\nbad " + replacement + "\n\nExit code: 1");
    }
}

TEST_CASE("run_state_to_string", "[exec][outcome]") {
    CHECK(run_state_to_string(RunState::Created) == "created");
    CHECK(run_state_to_string(RunState::Spawned) == "spawned");
    CHECK(run_state_to_string(RunState::Completed) == "completed");
    CHECK(run_state_to_string(RunState::TimedOut) == "timed_out");
    CHECK(run_state_to_string(RunState::Signaled) == "signaled");
    CHECK(run_state_to_string(RunState::Reaped) == "reaped");
    CHECK(run_state_to_string(RunState::GraceExpired) == "grace_expired");
    CHECK(run_state_to_string(RunState::Reported) == "reported");
}
