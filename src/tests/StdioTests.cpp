// SPDX-License-Identifier: Apache-2.0
#include <io/MemoryStreams.hpp>
#include <io/Stdio.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <thread>

using namespace chisel::io;

namespace
{
auto outputProvider(OutputStream& stream) -> OutputProvider
{
    return [&stream]() -> OutputStream& { return stream; };
}

auto inputProvider(InputStream& stream) -> InputProvider
{
    return [&stream]() -> InputStream& { return stream; };
}
} // namespace

TEST_CASE("Without overrides the standard streams are resolved", "[io]")
{
    CHECK_FALSE(StdioOverrides::active());
    CHECK(&resolveOutput() == &standardOutput());
    CHECK(&resolveInput() == &standardInput());
}

TEST_CASE("withOverrides resolves to the overriding streams inside the body", "[io]")
{
    auto output = StringOutputStream {};
    auto input = StringInputStream { "hello\n" };

    auto const line = withStreams(output, input, [&] {
        CHECK(StdioOverrides::active());
        CHECK(&resolveOutput() == &output);
        resolveOutput().write("inside");
        return resolveInput().readLine();
    });

    REQUIRE(line.has_value());
    CHECK(*line == "hello");
    CHECK(output.str() == "inside");
    CHECK_FALSE(StdioOverrides::active());
    CHECK(&resolveOutput() == &standardOutput());
}

TEST_CASE("Nested overrides restore the parent scope", "[io]")
{
    auto outer = StringOutputStream {};
    auto inner = StringOutputStream {};
    auto input = StringInputStream {};

    withStreams(outer, input, [&] {
        withOverrides(outputProvider(inner), {}, [&] {
            CHECK(&resolveOutput() == &inner);
            // An empty provider inherits the parent's stream, not the default.
            CHECK(&resolveInput() == &input);
        });
        CHECK(&resolveOutput() == &outer);
        CHECK(&resolveInput() == &input);
    });
}

TEST_CASE("Nested overrides restore the parent even if the body throws", "[io]")
{
    auto outer = StringOutputStream {};
    auto inner = StringOutputStream {};
    auto input = StringInputStream {};

    auto const throwing = [&] {
        withOverrides(outputProvider(inner), {}, [] { throw std::runtime_error("boom"); });
    };

    withOverrides(outputProvider(outer), inputProvider(input), [&] {
        CHECK_THROWS_AS(throwing(), std::runtime_error);
        CHECK(&resolveOutput() == &outer);
        CHECK(&resolveInput() == &input);
    });

    CHECK_FALSE(StdioOverrides::active());
}

TEST_CASE("A captured StdioOverrides outlives its scope", "[io]")
{
    auto output = StringOutputStream {};
    auto input = StringInputStream {};

    auto const captured = withStreams(output, input, [] { return StdioOverrides::current(); });
    CHECK_FALSE(StdioOverrides::active());
    CHECK(&captured.output() == &output);

    // Another thread has no active scope of its own but may still use the captured pair.
    auto threadSawScope = true;
    auto thread = std::thread([&captured, &threadSawScope] {
        threadSawScope = StdioOverrides::active();
        captured.output().write("from thread");
    });
    thread.join();
    CHECK_FALSE(threadSawScope);
    CHECK(output.str() == "from thread");
}

TEST_CASE("Overrides are per thread", "[io]")
{
    auto output = StringOutputStream {};
    auto input = StringInputStream {};

    withStreams(output, input, [] {
        auto seenActive = true;
        auto thread = std::thread([&seenActive] { seenActive = StdioOverrides::active(); });
        thread.join();
        CHECK_FALSE(seenActive);
    });
}

TEST_CASE("StringInputStream serves lines and bytes", "[io]")
{
    SECTION("lines strip LF and CRLF")
    {
        auto input = StringInputStream { "one\r\ntwo\nthree" };
        CHECK(input.readLine() == "one");
        CHECK(input.readLine() == "two");
        CHECK(input.readLine() == "three");
        CHECK_FALSE(input.readLine().has_value());
    }

    SECTION("bytes end with nullopt")
    {
        auto input = StringInputStream { "ab" };
        CHECK(input.readByte() == std::uint8_t { 'a' });
        CHECK(input.readByte() == std::uint8_t { 'b' });
        CHECK_FALSE(input.readByte().has_value());
        input.feed("c");
        CHECK(input.readByte() == std::uint8_t { 'c' });
    }

    SECTION("mode changes fail on a non-terminal")
    {
        auto input = StringInputStream { "", false };
        auto const result = input.setEchoMode(false);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == chisel::ErrorCode::NotInteractive);
        CHECK(input.echoMode());
    }
}

TEST_CASE("StringOutputStream counts writes", "[io]")
{
    auto output = StringOutputStream { false, 40 };
    output.write("a");
    output.write("b");
    CHECK(output.str() == "ab");
    CHECK(output.writeCount() == 2);
    CHECK_FALSE(output.isTerminal());
    CHECK(output.columns() == 40);
    output.clear();
    CHECK(output.str().empty());
}

TEST_CASE("StringOutputStream tracks whether the last write ended a line", "[io]")
{
    auto output = StringOutputStream {};
    CHECK(output.atLineStart());
    output.write("prompt: ");
    CHECK_FALSE(output.atLineStart());
    output.write("");
    CHECK_FALSE(output.atLineStart());
    output.write("answer\n");
    CHECK(output.atLineStart());
}
