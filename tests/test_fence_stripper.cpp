#include <catch2/catch.hpp>

#include "normalize/FenceStripper.hpp"

#include <chrono>
#include <string>
#include <vector>

using normalize::clean_markdown;
using normalize::remove_code_fences;
using normalize::strip;

TEST_CASE("strip returns empty for empty or blank input", "[strip]") {
    REQUIRE(strip("").empty());
    REQUIRE(strip("   \n\t ").empty());
}

TEST_CASE("strip removes conversational openers through the colon", "[strip]") {
    REQUIRE(strip("Here is the improved summary:\nBuilt things.") == "Built things.");
    REQUIRE(strip("Sure, here's the result: done") == "done");
    REQUIRE(strip("I have rewritten it for you: Led a team") == "Led a team");
    REQUIRE(strip("Below is the draft:\nHello") == "Hello");
    REQUIRE(strip("The improved version: **Led** migration") == "Led migration");

    // stacked openers are all removed
    REQUIRE(strip("Here is: Sure, fine: text") == "text");
}

TEST_CASE("strip keeps an opener whose colon is not on the first line", "[strip]") {
    REQUIRE(strip("Here is my story\nI worked: hard") == "Here is my story\nI worked: hard");
    REQUIRE(strip("Sure thing, no colon here") == "Sure thing, no colon here");
}

TEST_CASE("strip unwraps emphasis and keeps the enclosed text", "[strip]") {
    REQUIRE(strip("**Led** a team of __five__ engineers") == "Led a team of five engineers");
    REQUIRE(strip("*really* good and _very_ nice") == "really good and very nice");
    REQUIRE(strip("***both***") == "both");
}

TEST_CASE("strip leaves identifiers and arithmetic alone", "[strip]") {
    REQUIRE(strip("use my_var_name here") == "use my_var_name here");
    REQUIRE(strip("2 * 3 * 4") == "2 * 3 * 4");
    REQUIRE(strip("a ** b") == "a ** b");
}

TEST_CASE("strip normalizes list markers to a bullet", "[strip]") {
    REQUIRE(strip("- one\n* two\n  - three") == "\xE2\x80\xA2 one\n\xE2\x80\xA2 two\n  \xE2\x80\xA2 three");
    REQUIRE(strip("-not a bullet") == "-not a bullet");
    REQUIRE(strip("---") == "---");
}

TEST_CASE("strip removes code fences", "[strip]") {
    REQUIRE(strip("```json\n{\"a\":1}\n```") == "{\"a\":1}");
    REQUIRE(strip("```\nplain\n```") == "plain");
}

TEST_CASE("clean_markdown keeps fences but applies the other rules", "[strip]") {
    REQUIRE(clean_markdown("```x```") == "```x```");
    REQUIRE(clean_markdown("Here is it: **bold**") == "bold");
}

TEST_CASE("strip is idempotent", "[strip]") {
    const std::vector<std::string> samples = {
        "",
        "Sure, here's the result:\n```json\n{\"score\": 72}\n```",
        "Here is: Here is: x",
        "**a**b**",
        "***x** y*",
        "- **Led** the _migration_ of `svc`\n* __Cut__ costs by *20%*",
        "*",
        "**",
        "_a_b_c_",
        "  - \n- ",
        "`*`*`",
        "snake_case and *emph* and ** stars **",
        "The improved version:\n- one\n- two",
    };

    for (const auto& s : samples) {
        INFO("input: " << s);
        const std::string once = strip(s);
        REQUIRE(strip(once) == once);
        REQUIRE(clean_markdown(clean_markdown(s)) == clean_markdown(s));
    }
}

TEST_CASE("only the json tag is removed with a fence", "[strip]") {
    REQUIRE(remove_code_fences("```json\n{}\n```") == "\n{}\n");
    REQUIRE(remove_code_fences("```python") == "python");
    REQUIRE(strip("```python\nprint(1)\n```") == "python\nprint(1)");
}

static std::string repeat(const std::string& s, int n) {
    std::string out;
    out.reserve(s.size() * (size_t)n);
    for (int i = 0; i < n; ++i) out += s;
    return out;
}

static long long elapsed_ms(std::chrono::steady_clock::time_point t0) {
    return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
}

TEST_CASE("strip stays fast on long hostile input", "[strip]") {
    SECTION("unclosed emphasis openers") {
        const std::string in = repeat("*a ", 20000);
        const auto t0 = std::chrono::steady_clock::now();
        const std::string out = strip(in);
        REQUIRE(elapsed_ms(t0) < 2000);
        REQUIRE(out == in.substr(0, in.size() - 1));
    }

    SECTION("stacked openers") {
        const std::string in = repeat("Here is: ", 20000) + "body";
        const auto t0 = std::chrono::steady_clock::now();
        const std::string out = strip(in);
        REQUIRE(elapsed_ms(t0) < 2000);
        REQUIRE(out == "body");
    }

    SECTION("many short emphasis spans") {
        const std::string in = repeat("**a** ", 20000);
        const auto t0 = std::chrono::steady_clock::now();
        const std::string out = strip(in);
        REQUIRE(elapsed_ms(t0) < 2000);
        REQUIRE(out.find('*') == std::string::npos);
    }
}
