// SPDX-License-Identifier: Apache-2.0
#include <tui/Theme.hpp>

#include <array>
#include <utility>

namespace chisel::tui
{

namespace
{
    struct ThemeRole
    {
        std::string_view name;
        Style Theme::*member;
    };

    constexpr auto ThemeRoles = std::array {
        ThemeRole { "error", &Theme::error },
        ThemeRole { "warning", &Theme::warning },
        ThemeRole { "success", &Theme::success },
        ThemeRole { "alert", &Theme::alert },
        ThemeRole { "detail", &Theme::detail },
        ThemeRole { "hint", &Theme::hint },
        ThemeRole { "answer", &Theme::answer },
        ThemeRole { "pointer", &Theme::pointer },
        ThemeRole { "selected", &Theme::selected },
        ThemeRole { "spinner", &Theme::spinner },
        ThemeRole { "elapsed", &Theme::elapsed },
        ThemeRole { "progressSuccess", &Theme::progressSuccess },
        ThemeRole { "progressFailure", &Theme::progressFailure },
        ThemeRole { "progressCanceled", &Theme::progressCanceled },
    };
} // namespace

auto defaultTheme() -> Theme
{
    auto theme = Theme {};

    // Message styles
    theme.error = foreground(BasicColor::BrightRed);
    theme.warning.fg = BasicColor::Yellow;
    theme.warning.bold = true;
    theme.success = foreground(BasicColor::BrightGreen);
    theme.alert.fg = BasicColor::BrightCyan;
    theme.alert.bold = true;
    theme.detail = foreground(BasicColor::BrightBlack);

    // Prompt styles
    theme.hint = foreground(BasicColor::BrightBlack);
    theme.answer.fg = BasicColor::BrightCyan;
    theme.answer.dim = true;
    theme.pointer = foreground(BasicColor::Green);
    theme.selected = foreground(BasicColor::BrightCyan);

    // Progress styles
    theme.spinner = foreground(BasicColor::BrightGreen);
    theme.elapsed = foreground(BasicColor::BrightBlack);
    theme.progressSuccess = foreground(BasicColor::BrightGreen);
    theme.progressFailure = foreground(BasicColor::BrightRed);
    theme.progressCanceled = foreground(BasicColor::Yellow);

    return theme;
}

auto monoTheme() -> Theme
{
    auto theme = Theme {};

    theme.error.bold = true;
    theme.warning.bold = true;
    theme.alert.bold = true;
    theme.alert.underline = true;
    theme.detail.dim = true;

    theme.hint.dim = true;
    theme.answer.dim = true;
    theme.selected.inverse = true;

    theme.elapsed.dim = true;
    theme.progressFailure.bold = true;

    return theme;
}

auto themeByName(std::string_view name) -> Theme
{
    if (name == "mono")
        return monoTheme();
    return defaultTheme();
}

auto setThemeStyle(Theme& theme, std::string_view role, Style style) -> bool
{
    for (auto const& entry: ThemeRoles)
    {
        if (entry.name == role)
        {
            theme.*entry.member = std::move(style);
            return true;
        }
    }
    return false;
}

} // namespace chisel::tui
