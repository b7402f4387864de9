// SPDX-License-Identifier: Apache-2.0
#include <io/MemoryStreams.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <tui/Ansi.hpp>
#include <tui/Prompt.hpp>

using namespace chisel;
using namespace chisel::tui;

namespace
{
auto plainOptions() -> PromptOptions
{
    return PromptOptions { .theme = defaultTheme(), .styled = false, .mask = "******" };
}

auto const Colors = std::vector<std::string> { "red", "green", "blue" };
} // namespace

// =============================================================================
// Helpers
// =============================================================================

TEST_CASE("parseAnswer recognizes yes and no words", "[prompt]")
{
    for (auto const* word: { "y", "yes", "yea", "yeah", "yep", "yup", "Y", "YES", "Yup" })
        CHECK(parseAnswer(word) == true);
    for (auto const* word: { "n", "no", "nope", "N", "NO", "Nope" })
        CHECK(parseAnswer(word) == false);
    for (auto const* word: { "", "banana", "yess", "nah", "ok" })
        CHECK_FALSE(parseAnswer(word).has_value());
}

TEST_CASE("trim strips surrounding whitespace", "[prompt]")
{
    CHECK(trim("  a b \t\r\n") == "a b");
    CHECK(trim(" \t ").empty());
    CHECK(trim("").empty());
}

// =============================================================================
// text
// =============================================================================

TEST_CASE("Prompt text returns the default on empty input", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "\n" };
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.text("What is your name?", "Bob") == "Bob");

    // The terminal echoed the line feed, so two rows are erased before the redraw.
    CHECK(output.str()
          == "What is your name? (Bob) "
             "\r\033[2K\033[A\033[2K"
             "What is your name? (Bob) Bob\n");
}

TEST_CASE("Prompt text returns the typed answer", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "  Alice  \n" };
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.text("What is your name?", "Bob") == "Alice");
    CHECK(output.str().ends_with("What is your name? (Bob) Alice\n"));
}

TEST_CASE("Prompt text at end of input without a default returns an empty string", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream {};
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.text("Anything?").empty());

    // Nothing was echoed; the prompt moves to the next row itself before erasing.
    CHECK(output.str() == "Anything? \n\r\033[2K\033[A\033[2KAnything? \n");
}

TEST_CASE("Prompt text erases soft-wrapped input rows", "[prompt]")
{
    auto output = io::StringOutputStream { true, 20 };
    auto input = io::StringInputStream { std::string(30, 'z') + "\n" };
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.text("Name?") == std::string(30, 'z'));

    // "Name? " + 30 characters spans two rows, the line feed adds a third.
    CHECK(output.str().find("\r\033[2K\033[A\033[2K\033[A\033[2KName? ") != std::string::npos);
}

TEST_CASE("Prompt text erases every row of a multi-line message", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "Alice\n" };
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.text("Line one\nName?") == "Alice");

    // Two rows of message plus the row the echoed line feed moved to.
    CHECK(output.str().ends_with("\r\033[2K\033[A\033[2K\033[A\033[2KLine one\nName? Alice\n"));
}

TEST_CASE("Prompt text styles the hint and the answer", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "Alice\n" };
    auto const theme = defaultTheme();
    auto prompt = Prompt(output, input, PromptOptions { .theme = theme, .styled = true, .mask = "******" });

    CHECK(prompt.text("Name?", "Bob") == "Alice");
    CHECK(output.str().find(wrap("(Bob)", theme.hint)) != std::string::npos);
    CHECK(output.str().ends_with(wrap("Alice", theme.answer) + "\n"));
}

// =============================================================================
// hidden text
// =============================================================================

TEST_CASE("Hidden input is read raw and shown masked", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "sx\x7f" "ecret\r" "trailing" };
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.text("Password:", std::nullopt, true) == "secret");

    auto const text = output.str();
    CHECK(text.find("secret") == std::string::npos);
    CHECK(text.ends_with("Password: ******\n"));

    // Raw mode was entered and left again.
    CHECK(input.lineMode());
    CHECK(input.echoMode());
    CHECK(input.modeChanges().size() == 4);

    // Reading stopped at the carriage return.
    CHECK(input.remaining() == std::string_view("trailing").size());
}

TEST_CASE("Hidden input backspace handling", "[prompt]")
{
    auto output = io::StringOutputStream {};

    SECTION("backspace on an empty buffer is ignored")
    {
        auto input = io::StringInputStream { "\x7f\x7f" "ab\n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.text("Pin:", std::nullopt, true) == "ab");
    }

    SECTION("backspace removes a whole multi-byte character")
    {
        auto input = io::StringInputStream { "a\u00e9\x7f\n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.text("Pin:", std::nullopt, true) == "a");
    }

    SECTION("ASCII backspace works like delete")
    {
        auto input = io::StringInputStream { "abc\b\n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.text("Pin:", std::nullopt, true) == "ab");
    }
}

TEST_CASE("Hidden input at end of input returns the default, masked", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream {};
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.text("Token:", "fallback", true) == "fallback");
    CHECK(output.str().ends_with("Token: (fallback) ******\n"));
    CHECK(input.lineMode());
    CHECK(input.echoMode());
}

TEST_CASE("Hidden input on a non-terminal falls back to a line read", "[prompt]")
{
    auto output = io::StringOutputStream { false };
    auto input = io::StringInputStream { "pw\n", false };
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.text("Password:", std::nullopt, true) == "pw");
    CHECK(input.modeChanges().empty());
    CHECK(output.str().ends_with("Password: ******\n"));
}

// =============================================================================
// confirm
// =============================================================================

TEST_CASE("confirm interprets answers against the default", "[prompt]")
{
    auto output = io::StringOutputStream {};

    SECTION("empty input yields the default")
    {
        auto input = io::StringInputStream { "\n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.confirm("Continue?", true));
        CHECK(output.str().starts_with("Continue? (Y/n) "));
        CHECK(output.str().ends_with("Continue? (Y/n) Yes\n"));
    }

    SECTION("a negative answer")
    {
        auto input = io::StringInputStream { "n\n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK_FALSE(prompt.confirm("Continue?", true));
        CHECK(output.str().ends_with("Continue? (Y/n) No\n"));
    }

    SECTION("an unrecognized answer yields the default")
    {
        auto input = io::StringInputStream { "banana\n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.confirm("Continue?", true));
    }

    SECTION("answers are case-insensitive and trimmed")
    {
        auto input = io::StringInputStream { "  YeS \n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.confirm("Continue?"));
        CHECK(output.str().starts_with("Continue? (y/N) "));
    }

    SECTION("a multi-line message is erased as a whole")
    {
        auto input = io::StringInputStream { "y\n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.confirm("Careful\nContinue?"));
        CHECK(output.str()
              == "Careful\nContinue? (y/N) "
                 "\r\033[2K\033[A\033[2K\033[A\033[2K"
                 "Careful\nContinue? (y/N) Yes\n");
    }

    SECTION("end of input yields the default")
    {
        auto input = io::StringInputStream {};
        auto prompt = Prompt(output, input, plainOptions());
        CHECK_FALSE(prompt.confirm("Continue?"));
        CHECK(output.str().ends_with("Continue? (y/N) No\n"));
    }
}

// =============================================================================
// chooseOne
// =============================================================================

TEST_CASE("chooseOne moves with the arrow keys and confirms with enter", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "\033[B\n" };
    auto prompt = Prompt(output, input, plainOptions());

    auto const choice = prompt.chooseOne("Pick a color", Colors, "green");
    REQUIRE(choice.has_value());
    CHECK(*choice == "blue");

    auto const text = output.str();
    CHECK(text.starts_with("\0337\033[?25lPick a color\n  \u25EF red\n\u276F \u25C9 green\n  \u25EF blue"));
    CHECK(text.find("\0338\033[J") != std::string::npos);
    CHECK(text.ends_with("\0338\033[J\033[?25hPick a color blue\n"));

    CHECK(input.lineMode());
    CHECK(input.echoMode());
}

TEST_CASE("chooseOne wraps around at both ends", "[prompt]")
{
    auto output = io::StringOutputStream {};

    SECTION("up from the first choice selects the last")
    {
        auto input = io::StringInputStream { "\033[A\r" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.chooseOne("Pick", Colors) == "blue");
    }

    SECTION("down from the last choice selects the first")
    {
        auto input = io::StringInputStream { "\033[B\033OB\033[B\n" };
        auto prompt = Prompt(output, input, plainOptions());
        CHECK(prompt.chooseOne("Pick", Colors) == "red");
    }
}

TEST_CASE("chooseOne ignores unrelated keys", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "x\033[C\033[B\n" };
    auto prompt = Prompt(output, input, plainOptions());
    CHECK(prompt.chooseOne("Pick", Colors) == "green");
}

TEST_CASE("chooseOne at end of input keeps the default", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "\033[B" };
    auto prompt = Prompt(output, input, plainOptions());

    CHECK(prompt.chooseOne("Pick", Colors, "green") == "green");
    CHECK(output.str().ends_with("\033[?25hPick green\n"));
    CHECK(input.lineMode());
    CHECK(input.echoMode());
}

TEST_CASE("chooseOne with an unknown default starts at the first choice", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "\n" };
    auto prompt = Prompt(output, input, plainOptions());
    CHECK(prompt.chooseOne("Pick", Colors, "purple") == "red");
}

TEST_CASE("chooseOne reports errors", "[prompt]")
{
    auto output = io::StringOutputStream {};

    SECTION("on a non-interactive stream")
    {
        auto input = io::StringInputStream { "\n", false };
        auto prompt = Prompt(output, input, plainOptions());
        auto const choice = prompt.chooseOne("Pick", Colors);
        REQUIRE_FALSE(choice.has_value());
        CHECK(choice.error().code == ErrorCode::NotInteractive);
        CHECK(output.str().empty());
    }

    SECTION("for an empty list")
    {
        auto input = io::StringInputStream { "\n" };
        auto prompt = Prompt(output, input, plainOptions());
        auto const choice = prompt.chooseOne("Pick", std::vector<std::string> {});
        REQUIRE_FALSE(choice.has_value());
        CHECK(choice.error().code == ErrorCode::InvalidArgument);
        CHECK(input.modeChanges().empty());
    }
}

TEST_CASE("chooseOne inside an active raw mode leaves raw mode on", "[prompt]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "\n" };
    REQUIRE(input.setEchoMode(false).has_value());
    REQUIRE(input.setLineMode(false).has_value());

    auto prompt = Prompt(output, input, plainOptions());
    CHECK(prompt.chooseOne("Pick", Colors) == "red");
    CHECK_FALSE(input.lineMode());
    CHECK_FALSE(input.echoMode());
}
