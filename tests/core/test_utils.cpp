#include <catch2/catch_test_macros.hpp>

#include <string>

#include "shellguard/core/utils.hpp"

TEST_CASE("trim removes whitespace", "[utils]") {
    SECTION("leading and trailing spaces") {
        REQUIRE(shellguard::utils::trim("  hello  ") == "hello");
    }

    SECTION("leading and trailing tabs and newlines") {
        REQUIRE(shellguard::utils::trim("\t\nhello\r\n") == "hello");
    }

    SECTION("empty string") {
        REQUIRE(shellguard::utils::trim("") == "");
    }

    SECTION("only whitespace") {
        REQUIRE(shellguard::utils::trim("   \t\n  ") == "");
    }

    SECTION("internal whitespace preserved") {
        REQUIRE(shellguard::utils::trim("  ls  -la  ") == "ls  -la");
    }
}

TEST_CASE("to_lower", "[utils]") {
    CHECK(shellguard::utils::to_lower("RM -RF /") == "rm -rf /");
    CHECK(shellguard::utils::to_lower("MiXeD 123") == "mixed 123");
}

TEST_CASE("sanitize_utf8 replaces malformed sequences", "[utils]") {
    using shellguard::utils::sanitize_utf8;
    const std::string replacement = "\xEF\xBF\xBD";

    SECTION("valid text is unchanged") {
        CHECK(sanitize_utf8("plain ascii") == "plain ascii");
        CHECK(sanitize_utf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80") ==
              "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
    }

    SECTION("stray bytes are replaced one by one") {
        CHECK(sanitize_utf8("\xFF\xFE") == replacement + replacement);
        CHECK(sanitize_utf8("a\x80" "b") == "a" + replacement + "b");
    }

    SECTION("a broken sequence becomes one replacement") {
        CHECK(sanitize_utf8("\xE2\x82x") == replacement + "x");
        CHECK(sanitize_utf8("end\xC3") == "end" + replacement);
    }

    SECTION("overlong forms and surrogates are rejected") {
        CHECK(sanitize_utf8("\xC0\xAF") != "\xC0\xAF");
        CHECK(sanitize_utf8("\xED\xA0\x80").find("\xED") == std::string::npos);
    }
}

TEST_CASE("utf8_floor keeps characters whole", "[utils]") {
    using shellguard::utils::utf8_floor;
    const std::string text = "a\xC3\xA9\xE2\x82\xAC";  // a, e-acute, euro sign

    CHECK(utf8_floor(text, 0) == 0);
    CHECK(utf8_floor(text, 1) == 1);
    CHECK(utf8_floor(text, 2) == 1);
    CHECK(utf8_floor(text, 3) == 3);
    CHECK(utf8_floor(text, 4) == 3);
    CHECK(utf8_floor(text, 5) == 3);
    CHECK(utf8_floor(text, 6) == 6);
    CHECK(utf8_floor(text, 100) == 6);
    CHECK(utf8_floor("ab\xC3", 3) == 2);
}

TEST_CASE("camel_to_snake", "[utils]") {
    using shellguard::utils::camel_to_snake;
    CHECK(camel_to_snake("restrictToWorkspace") == "restrict_to_workspace");
    CHECK(camel_to_snake("maxOutputChars") == "max_output_chars");
    CHECK(camel_to_snake("timeout") == "timeout");
    CHECK(camel_to_snake("deny_patterns") == "deny_patterns");
}

TEST_CASE("percent_decode", "[utils]") {
    using shellguard::utils::percent_decode;

    SECTION("decodes well-formed sequences") {
        CHECK(percent_decode("%2e%2e%2f") == "../");
        CHECK(percent_decode("%2E%2E%5C") == "..\\");
        CHECK(percent_decode("a%20b") == "a b");
    }

    SECTION("sequence at the very end") {
        CHECK(percent_decode("x%2f") == "x/");
    }

    SECTION("malformed sequences stay literal") {
        CHECK(percent_decode("100%") == "100%");
        CHECK(percent_decode("%2") == "%2");
        CHECK(percent_decode("%zz") == "%zz");
    }

    SECTION("plus is not a space") {
        CHECK(percent_decode("a+b") == "a+b");
    }
}

TEST_CASE("parse_bool", "[utils]") {
    using shellguard::utils::parse_bool;

    CHECK(parse_bool("1") == true);
    CHECK(parse_bool("TRUE") == true);
    CHECK(parse_bool(" yes ") == true);
    CHECK(parse_bool("on") == true);
    CHECK(parse_bool("0") == false);
    CHECK(parse_bool("False") == false);
    CHECK(parse_bool("no") == false);
    CHECK(parse_bool("OFF") == false);
    CHECK_FALSE(parse_bool("maybe").has_value());
    CHECK_FALSE(parse_bool("").has_value());
}

TEST_CASE("parse_int", "[utils]") {
    using shellguard::utils::parse_int;

    CHECK(parse_int("30") == 30);
    CHECK(parse_int(" 120 ") == 120);
    CHECK(parse_int("-5") == -5);
    CHECK_FALSE(parse_int("").has_value());
    CHECK_FALSE(parse_int("12s").has_value());
    CHECK_FALSE(parse_int("abc").has_value());
}
