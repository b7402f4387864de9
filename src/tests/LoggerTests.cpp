// SPDX-License-Identifier: Apache-2.0
#include <chisel/Logger.hpp>

#include <io/MemoryStreams.hpp>
#include <io/Stdio.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace chisel;
using namespace std::chrono_literals;

TEST_CASE("Logger message styles", "[logger]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream {};
    auto logger = Logger(output, input);

    SECTION("info is unstyled")
    {
        logger.info("hello");
        CHECK(output.str() == "hello\n");
    }

    SECTION("err is bright red")
    {
        logger.err("oops");
        CHECK(output.str() == "\033[91moops\033[0m\n");
    }

    SECTION("warn is bold yellow with a tag")
    {
        logger.warn("careful");
        logger.warn("heads up", "NOTE");
        CHECK(output.str() == "\033[1;33m[WARN] careful\033[0m\n\033[1;33m[NOTE] heads up\033[0m\n");
    }

    SECTION("success is bright green")
    {
        logger.success("done");
        CHECK(output.str() == "\033[92mdone\033[0m\n");
    }

    SECTION("alert is bold bright cyan")
    {
        logger.alert("look");
        CHECK(output.str() == "\033[1;96mlook\033[0m\n");
    }

    SECTION("detail is gray")
    {
        logger.detail("fine print");
        CHECK(output.str() == "\033[90mfine print\033[0m\n");
    }

    SECTION("write adds no line feed")
    {
        logger.write("a");
        logger.write("b");
        CHECK(output.str() == "ab");
    }
}

TEST_CASE("Each Logger message is a single write", "[logger]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream {};
    auto logger = Logger(output, input);

    logger.err("one");
    logger.warn("two");
    CHECK(output.writeCount() == 2);
}

TEST_CASE("Logger color modes", "[logger]")
{
    auto input = io::StringInputStream {};

    SECTION("never")
    {
        auto output = io::StringOutputStream {};
        auto logger = Logger(output, input, LoggerOptions { .colorMode = ColorMode::Never });
        logger.err("plain");
        CHECK(output.str() == "plain\n");
        CHECK_FALSE(logger.styling());
    }

    SECTION("auto on a non-terminal")
    {
        auto output = io::StringOutputStream { false };
        auto logger = Logger(output, input, LoggerOptions { .colorMode = ColorMode::Auto });
        logger.warn("plain");
        CHECK(output.str() == "[WARN] plain\n");
    }

    SECTION("auto on a terminal")
    {
        auto output = io::StringOutputStream { true };
        auto logger = Logger(output, input, LoggerOptions { .colorMode = ColorMode::Auto });
        CHECK(logger.styling());
    }

    SECTION("always on a non-terminal")
    {
        auto output = io::StringOutputStream { false };
        auto logger = Logger(output, input);
        logger.success("styled");
        CHECK(output.str() == "\033[92mstyled\033[0m\n");
    }
}

TEST_CASE("parseColorMode and colorModeName agree", "[logger]")
{
    for (auto const mode: { ColorMode::Always, ColorMode::Auto, ColorMode::Never })
        CHECK(parseColorMode(colorModeName(mode)) == mode);
    CHECK_FALSE(parseColorMode("sometimes").has_value());
}

TEST_CASE("Delayed messages are emitted on flush", "[logger]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream {};
    auto logger = Logger(output, input);

    logger.delayed("first");
    logger.delayed("second");
    logger.info("now");
    CHECK(logger.pendingCount() == 2);
    CHECK(output.str() == "now\n");

    SECTION("through info by default")
    {
        logger.flush();
        CHECK(output.str() == "now\nfirst\nsecond\n");
    }

    SECTION("through a custom sink")
    {
        auto seen = std::vector<std::string> {};
        logger.flush([&seen](std::string_view message) { seen.emplace_back(message); });
        CHECK(seen == std::vector<std::string> { "first", "second" });
        CHECK(output.str() == "now\n");
    }

    SECTION("flush is idempotent")
    {
        logger.flush();
        auto const snapshot = output.str();
        logger.flush();
        CHECK(output.str() == snapshot);
        CHECK(logger.pendingCount() == 0);
    }
}

TEST_CASE("Logger captures the streams active at construction", "[logger]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream { "Alice\n" };

    auto logger = io::withStreams(output, input, [] { return Logger(LoggerOptions { .colorMode = ColorMode::Never }); });

    // The scope has ended; the logger keeps using the overriding streams.
    CHECK(&logger.output() == &output);
    CHECK(&logger.input() == &input);
    logger.info("after scope");
    CHECK(logger.prompt("Name?") == "Alice");
    CHECK(output.str().starts_with("after scope\n"));
}

TEST_CASE("Progress created by a Logger writes to the captured stream", "[logger]")
{
    auto output = io::StringOutputStream {};
    auto input = io::StringInputStream {};

    io::withStreams(output, input, [] {
        auto logger = Logger(LoggerOptions { .colorMode = ColorMode::Never,
                                             .spinner = tui::SpinnerType::Line,
                                             .progressInterval = 1ms });
        auto progress = logger.progress("Working");
        auto const deadline = std::chrono::steady_clock::now() + 5s;
        while (progress.elapsed() < 20ms && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(1ms);
        progress.complete();
    });

    auto const text = output.str();
    CHECK(text.starts_with("- Working... ("));
    CHECK(text.find("\u2713 Working (") != std::string::npos);
}

TEST_CASE("Logger prompts use its streams and options", "[logger]")
{
    auto output = io::StringOutputStream {};

    SECTION("prompt")
    {
        auto input = io::StringInputStream { "\n" };
        auto logger = Logger(output, input, LoggerOptions { .colorMode = ColorMode::Never });
        CHECK(logger.prompt("Name?", { .defaultValue = "Bob", .hidden = false }) == "Bob");
    }

    SECTION("hidden prompt uses the configured mask")
    {
        auto input = io::StringInputStream { "hunter2\n" };
        auto logger = Logger(output, input, LoggerOptions { .colorMode = ColorMode::Never, .mask = "xxx" });
        CHECK(logger.prompt("Password:", { .defaultValue = std::nullopt, .hidden = true }) == "hunter2");
        CHECK(output.str().ends_with("Password: xxx\n"));
    }

    SECTION("confirm")
    {
        auto input = io::StringInputStream { "nope\n" };
        auto logger = Logger(output, input);
        CHECK_FALSE(logger.confirm("Continue?", true));
    }

    SECTION("chooseOne")
    {
        auto input = io::StringInputStream { "\033[B\n" };
        auto logger = Logger(output, input);
        auto const choices = std::vector<std::string> { "red", "green", "blue" };
        CHECK(logger.chooseOne("Color?", choices, "green") == "blue");
    }
}
