// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace chisel::tui
{

/// @brief The 16 standard ANSI colors.
enum class BasicColor : std::uint8_t
{
    Black,
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    White,
    BrightBlack,
    BrightRed,
    BrightGreen,
    BrightYellow,
    BrightBlue,
    BrightMagenta,
    BrightCyan,
    BrightWhite,
};

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

/// @brief Color representation: default, basic ANSI color, 256-color index, or true color (RGB).
using Color = std::variant<std::monostate, BasicColor, std::uint8_t, RgbColor>;

/// @brief Text styling attributes for terminal output.
struct Style
{
    Color fg;                   ///< Foreground color.
    Color bg;                   ///< Background color.
    bool bold = false;          ///< Bold text.
    bool dim = false;           ///< Dim/faint text.
    bool italic = false;        ///< Italic text.
    bool underline = false;     ///< Underlined text.
    bool inverse = false;       ///< Inverse/reverse video.
    bool strikethrough = false; ///< Strikethrough text.

    /// @brief Returns true if no attribute is set.
    [[nodiscard]] auto empty() const noexcept -> bool;
};

/// @brief Convenience constructor for a foreground-only style.
[[nodiscard]] auto foreground(Color color) -> Style;

namespace ansi
{
    constexpr auto Reset = std::string_view { "\033[0m" };
    constexpr auto SaveCursor = std::string_view { "\0337" };
    constexpr auto RestoreCursor = std::string_view { "\0338" };
    constexpr auto HideCursor = std::string_view { "\033[?25l" };
    constexpr auto ShowCursor = std::string_view { "\033[?25h" };
    constexpr auto ClearLine = std::string_view { "\033[2K" };
    constexpr auto ClearToEndOfScreen = std::string_view { "\033[J" };
    constexpr auto CursorUp = std::string_view { "\033[A" };
    constexpr auto CarriageReturn = std::string_view { "\r" };
} // namespace ansi

/// @brief Returns the SGR sequence selecting @p style, or an empty string for an empty style.
[[nodiscard]] auto sgr(Style const& style) -> std::string;

/// @brief Surrounds @p text with the SGR sequence of @p style and a reset.
///
/// Wrapping composes: a reset already terminating @p text is absorbed, and
/// resets inside @p text re-open @p style, so wrap(wrap(s, a), b) ends in
/// exactly one reset and never leaves @p s partially unstyled. An empty
/// style returns @p text unchanged.
[[nodiscard]] auto wrap(std::string_view text, Style const& style) -> std::string;

/// @brief Parses a whitespace separated style spec.
///
/// Tokens: bold, dim, italic, underline, inverse, strikethrough, a color name
/// (red, bright-cyan, gray, ...), "#rrggbb", "color(N)", and any of those
/// colors prefixed by "on-" for the background. Unknown tokens are ignored.
[[nodiscard]] auto parseStyle(std::string_view spec) -> Style;

/// @brief Removes CSI and ESC 7/8 sequences from @p text.
[[nodiscard]] auto stripAnsi(std::string_view text) -> std::string;

} // namespace chisel::tui
