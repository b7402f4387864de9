// SPDX-License-Identifier: Apache-2.0
#include <io/MemoryStreams.hpp>
#include <io/RawMode.hpp>

#include <catch2/catch_test_macros.hpp>

#include <utility>

using namespace chisel;
using namespace chisel::io;

TEST_CASE("RawModeSession disables line mode and echo and restores them", "[rawmode]")
{
    auto input = StringInputStream {};

    {
        auto session = RawModeSession::acquire(input);
        REQUIRE(session.has_value());
        CHECK(session->owning());
        CHECK_FALSE(session->nested());
        CHECK_FALSE(input.lineMode());
        CHECK_FALSE(input.echoMode());
    }

    CHECK(input.lineMode());
    CHECK(input.echoMode());
}

TEST_CASE("RawModeSession release is idempotent", "[rawmode]")
{
    auto input = StringInputStream {};
    auto session = RawModeSession::acquire(input);
    REQUIRE(session.has_value());

    session->release();
    auto const changesAfterRelease = input.modeChanges().size();
    session->release();

    CHECK_FALSE(session->owning());
    CHECK(input.modeChanges().size() == changesAfterRelease);
    CHECK(input.lineMode());
    CHECK(input.echoMode());
}

TEST_CASE("Nested RawModeSessions restore the state before the outermost one", "[rawmode]")
{
    auto input = StringInputStream {};

    auto outer = RawModeSession::acquire(input);
    REQUIRE(outer.has_value());
    {
        auto inner = RawModeSession::acquire(input);
        REQUIRE(inner.has_value());
        CHECK(inner->nested());
        CHECK_FALSE(inner->owning());
    }

    // Releasing the inner session must not leave raw mode.
    CHECK_FALSE(input.lineMode());
    CHECK_FALSE(input.echoMode());

    outer->release();
    CHECK(input.lineMode());
    CHECK(input.echoMode());
}

TEST_CASE("RawModeSession restores only the bits that were set", "[rawmode]")
{
    auto input = StringInputStream {};
    REQUIRE(input.setEchoMode(false).has_value());
    auto const changesBefore = input.modeChanges().size();

    {
        auto session = RawModeSession::acquire(input);
        REQUIRE(session.has_value());
        CHECK(session->owning());
    }

    CHECK(input.lineMode());
    CHECK_FALSE(input.echoMode());

    // One change to disable line mode, one to restore it. Echo was never touched.
    auto const& changes = input.modeChanges();
    REQUIRE(changes.size() == changesBefore + 2);
    CHECK_FALSE(changes[changesBefore].lineMode);
    CHECK(changes[changesBefore + 1].lineMode);
}

TEST_CASE("RawModeSession cannot be acquired on a non-terminal", "[rawmode]")
{
    auto input = StringInputStream { "", false };
    auto const session = RawModeSession::acquire(input);
    REQUIRE_FALSE(session.has_value());
    CHECK(session.error().code == ErrorCode::NotInteractive);
    CHECK(input.modeChanges().empty());
}

TEST_CASE("A moved RawModeSession restores once", "[rawmode]")
{
    auto input = StringInputStream {};
    auto acquired = RawModeSession::acquire(input);
    REQUIRE(acquired.has_value());

    auto session = std::move(*acquired);
    CHECK(session.owning());
    CHECK_FALSE(acquired->owning());

    acquired->release();
    CHECK_FALSE(input.lineMode());

    session.release();
    CHECK(input.lineMode());
    CHECK(input.echoMode());
}
