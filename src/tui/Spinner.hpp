// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace chisel::tui
{

/// @brief Predefined spinner animation patterns.
enum class SpinnerType : std::uint8_t
{
    Dots,   ///< ⠋ ⠙ ⠹ ⠸ ⠼ ⠴ ⠦ ⠧ ⠇ ⠏
    Line,   ///< - \ | /
    Circle, ///< ◐ ◓ ◑ ◒
    Arc,    ///< ◜ ◠ ◝ ◞ ◡ ◟
    Bounce, ///< ⠁ ⠂ ⠄ ⠂
};

/// @brief Returns the frames for a given spinner type.
[[nodiscard]] auto spinnerFrames(SpinnerType type) -> std::span<std::string_view const>;

/// @brief Returns the recommended frame interval for a spinner type in milliseconds.
[[nodiscard]] auto spinnerInterval(SpinnerType type) -> std::chrono::milliseconds;

/// @brief Parses a spinner name as written in the configuration ("dots", "line", ...).
[[nodiscard]] auto parseSpinnerType(std::string_view name) -> std::optional<SpinnerType>;

/// @brief Cycles through the frames of a spinner animation.
///
/// Timing is left to the owner; every advance() moves to the next frame.
class Spinner
{
  public:
    /// @brief Constructs a spinner with the given type.
    /// @param type The spinner animation pattern.
    explicit Spinner(SpinnerType type = SpinnerType::Dots);

    /// @brief Advances to the next frame, wrapping around.
    void advance() noexcept;

    /// @brief Returns the current frame as a string.
    [[nodiscard]] auto currentFrame() const noexcept -> std::string_view;

    /// @brief Returns the current frame index.
    [[nodiscard]] auto frameIndex() const noexcept -> std::size_t;

    /// @brief Returns the number of frames in the animation.
    [[nodiscard]] auto frameCount() const noexcept -> std::size_t;

    /// @brief Resets the spinner to the first frame.
    void reset() noexcept;

  private:
    std::span<std::string_view const> _frames;
    std::size_t _frameIndex = 0;
};

} // namespace chisel::tui
