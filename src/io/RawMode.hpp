// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <io/Stdio.hpp>

namespace chisel::io
{

/// @brief Scoped exclusive control over a terminal input stream.
///
/// While the session is held, line buffering and echo are disabled. Releasing
/// the session (explicitly or by destruction) restores exactly the mode bits
/// found at acquisition. Acquiring while the stream is already raw yields a
/// session whose release changes nothing, so nested sessions unwind to the
/// state before the outermost one.
class RawModeSession
{
  public:
    /// @brief Disables line mode and echo on @p input.
    /// @return The session, or NotInteractive if @p input is not a terminal.
    [[nodiscard]] static auto acquire(InputStream& input) -> Result<RawModeSession>;

    ~RawModeSession();

    RawModeSession(RawModeSession const&) = delete;
    auto operator=(RawModeSession const&) -> RawModeSession& = delete;
    RawModeSession(RawModeSession&& other) noexcept;
    auto operator=(RawModeSession&& other) noexcept -> RawModeSession&;

    /// @brief Restores the mode bits found at acquisition. Idempotent.
    void release();

    /// @brief Returns true if this session changed the stream's modes and has not released them yet.
    [[nodiscard]] auto owning() const noexcept -> bool;

    /// @brief Returns true if the stream was already raw when this session was acquired.
    [[nodiscard]] auto nested() const noexcept -> bool;

  private:
    RawModeSession(InputStream* input, bool previousLineMode, bool previousEchoMode, bool owning) noexcept;

    InputStream* _input = nullptr;
    bool _previousLineMode = true;
    bool _previousEchoMode = true;
    bool _owning = false;
};

} // namespace chisel::io
