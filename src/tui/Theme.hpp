// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>

#include <tui/Ansi.hpp>

namespace chisel::tui
{

/// @brief Styles used by the Logger, prompts and progress indicators.
///
/// Each member names a semantic role, so a configuration file can restyle a
/// role without knowing where it is used.
struct Theme
{
    // Message styles
    Style error;            ///< Logger::err.
    Style warning;          ///< Logger::warn, including the [TAG] prefix.
    Style success;          ///< Logger::success.
    Style alert;            ///< Logger::alert.
    Style detail;           ///< Logger::detail.

    // Prompt styles
    Style hint;             ///< "(default)", "(Y/n)" hints after a prompt.
    Style answer;           ///< Accepted answer shown after a prompt completed.
    Style pointer;          ///< The ❯ arrow in front of the selected choice.
    Style selected;         ///< Marker and text of the selected choice.

    // Progress styles
    Style spinner;          ///< Animated spinner frame.
    Style elapsed;          ///< "(1.2s)" suffix.
    Style progressSuccess;  ///< ✓ glyph.
    Style progressFailure;  ///< ✗ glyph.
    Style progressCanceled; ///< ⊘ glyph.
};

/// @brief Returns the default color theme.
[[nodiscard]] auto defaultTheme() -> Theme;

/// @brief Returns a minimal monochrome theme using only bold, dim and inverse.
[[nodiscard]] auto monoTheme() -> Theme;

/// @brief Returns the theme with the given name ("default" or "mono").
/// @return The theme, or the default theme for unknown names.
[[nodiscard]] auto themeByName(std::string_view name) -> Theme;

/// @brief Replaces the style of the role named @p role ("error", "hint", ...).
/// @return False if @p role is not a known role; the theme is unchanged then.
auto setThemeStyle(Theme& theme, std::string_view role, Style style) -> bool;

} // namespace chisel::tui
