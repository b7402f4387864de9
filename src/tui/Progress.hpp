// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <io/Stdio.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <tui/Spinner.hpp>
#include <tui/Theme.hpp>

namespace chisel::tui
{

/// @brief Lifecycle of a progress indicator.
enum class ProgressState : std::uint8_t
{
    Idle,
    Running,
    Succeeded,
    Failed,
    Canceled,
};

/// @brief Appearance and timing of a progress indicator.
struct ProgressOptions
{
    SpinnerType spinner = SpinnerType::Dots;

    /// @brief Time between redraws. Zero selects the spinner's own interval.
    std::chrono::milliseconds interval { 0 };

    Theme theme = defaultTheme();
    bool styled = true;
};

/// @brief Formats an elapsed time the way the indicator shows it: "(42ms)" or "(1.5s)".
[[nodiscard]] auto formatElapsed(std::chrono::milliseconds elapsed) -> std::string;

/// @brief A live status line with spinner and elapsed time, ticking in the background.
///
/// Construction prints the line and starts a ticker thread that redraws it in
/// place. The first of complete(), fail() or cancel() stops the ticker and
/// prints the final line with an outcome glyph and a newline; any later call
/// is ignored, so cleanup code may call fail() unconditionally. Each redraw
/// erases only the rows the previous frame occupied. If the stream's last
/// write did not end a line, the indicator starts on the next row.
///
/// While the indicator runs it owns the stream; callers must not write to the
/// same stream until it completed. Destroying a running indicator cancels it.
class Progress
{
  public:
    /// @brief Prints the initial line and starts ticking.
    /// @param stream The stream to draw on.
    /// @param message The message shown after the spinner.
    /// @param options Appearance and timing.
    Progress(io::OutputStream& stream, std::string message, ProgressOptions options = {});
    ~Progress();

    Progress(Progress const&) = delete;
    auto operator=(Progress const&) -> Progress& = delete;
    Progress(Progress&& other) noexcept;
    auto operator=(Progress&& other) noexcept -> Progress&;

    /// @brief Replaces the message while running. Ignored after completion.
    void update(std::string message);

    /// @brief Finishes with a ✓ and the given (or current) message.
    void complete(std::optional<std::string> message = std::nullopt);

    /// @brief Finishes with a ✗ and the given (or current) message.
    void fail(std::optional<std::string> message = std::nullopt);

    /// @brief Finishes with a ⊘ and the current message.
    void cancel();

    /// @brief Returns the current state.
    [[nodiscard]] auto state() const -> ProgressState;

    /// @brief Returns the current message.
    [[nodiscard]] auto message() const -> std::string;

    /// @brief Returns the time since construction, frozen once finished.
    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace chisel::tui
