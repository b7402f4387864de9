// SPDX-License-Identifier: Apache-2.0
#include <tui/Ansi.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <optional>
#include <ranges>

namespace chisel::tui
{

namespace
{

    struct NamedColor
    {
        std::string_view name;
        BasicColor color;
    };

    constexpr auto NamedColors = std::array {
        NamedColor { "black", BasicColor::Black },
        NamedColor { "red", BasicColor::Red },
        NamedColor { "green", BasicColor::Green },
        NamedColor { "yellow", BasicColor::Yellow },
        NamedColor { "blue", BasicColor::Blue },
        NamedColor { "magenta", BasicColor::Magenta },
        NamedColor { "cyan", BasicColor::Cyan },
        NamedColor { "white", BasicColor::White },
        NamedColor { "bright-black", BasicColor::BrightBlack },
        NamedColor { "gray", BasicColor::BrightBlack },
        NamedColor { "grey", BasicColor::BrightBlack },
        NamedColor { "dark-gray", BasicColor::BrightBlack },
        NamedColor { "bright-red", BasicColor::BrightRed },
        NamedColor { "light-red", BasicColor::BrightRed },
        NamedColor { "bright-green", BasicColor::BrightGreen },
        NamedColor { "light-green", BasicColor::BrightGreen },
        NamedColor { "bright-yellow", BasicColor::BrightYellow },
        NamedColor { "light-yellow", BasicColor::BrightYellow },
        NamedColor { "bright-blue", BasicColor::BrightBlue },
        NamedColor { "light-blue", BasicColor::BrightBlue },
        NamedColor { "bright-magenta", BasicColor::BrightMagenta },
        NamedColor { "light-magenta", BasicColor::BrightMagenta },
        NamedColor { "bright-cyan", BasicColor::BrightCyan },
        NamedColor { "light-cyan", BasicColor::BrightCyan },
        NamedColor { "bright-white", BasicColor::BrightWhite },
    };

    auto parseHexByte(std::string_view hex) -> std::optional<std::uint8_t>
    {
        auto value = 0u;
        auto const [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
        if (ec != std::errc {} || ptr != hex.data() + hex.size())
            return std::nullopt;
        return static_cast<std::uint8_t>(value);
    }

    /// @brief Parses a single color token, e.g. "bright-cyan", "#ff8800", "color(244)".
    auto parseColor(std::string_view token) -> std::optional<Color>
    {
        for (auto const& named: NamedColors)
            if (named.name == token)
                return Color { named.color };

        if (token.size() == 7 && token.front() == '#')
        {
            auto const r = parseHexByte(token.substr(1, 2));
            auto const g = parseHexByte(token.substr(3, 2));
            auto const b = parseHexByte(token.substr(5, 2));
            if (r && g && b)
                return Color { RgbColor { .r = *r, .g = *g, .b = *b } };
            return std::nullopt;
        }

        if (token.starts_with("color(") && token.ends_with(')'))
        {
            auto const digits = token.substr(6, token.size() - 7);
            auto value = 0;
            auto const [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec == std::errc {} && ptr == digits.data() + digits.size() && value >= 0 && value <= 255)
                return Color { static_cast<std::uint8_t>(value) };
        }

        return std::nullopt;
    }

    /// @brief Appends the SGR parameters of a color; @p base is 30 for foreground, 40 for background.
    void appendColor(std::string& out, Color const& color, int base)
    {
        if (auto const* basic = std::get_if<BasicColor>(&color))
        {
            auto const index = static_cast<int>(*basic);
            out += std::format("{}", index < 8 ? base + index : base + 60 + (index - 8));
        }
        else if (auto const* idx = std::get_if<std::uint8_t>(&color))
        {
            out += std::format("{};5;{}", base + 8, *idx);
        }
        else if (auto const* rgb = std::get_if<RgbColor>(&color))
        {
            out += std::format("{};2;{};{};{}", base + 8, rgb->r, rgb->g, rgb->b);
        }
    }

} // namespace

auto Style::empty() const noexcept -> bool
{
    return std::holds_alternative<std::monostate>(fg) && std::holds_alternative<std::monostate>(bg) && !bold
           && !dim && !italic && !underline && !inverse && !strikethrough;
}

auto foreground(Color color) -> Style
{
    auto style = Style {};
    style.fg = color;
    return style;
}

auto sgr(Style const& style) -> std::string
{
    if (style.empty())
        return {};

    auto out = std::string { "\033[" };
    auto needSemicolon = false;
    auto const appendSep = [&]() {
        if (needSemicolon)
            out += ';';
        needSemicolon = true;
    };

    if (style.bold)
    {
        appendSep();
        out += '1';
    }
    if (style.dim)
    {
        appendSep();
        out += '2';
    }
    if (style.italic)
    {
        appendSep();
        out += '3';
    }
    if (style.underline)
    {
        appendSep();
        out += '4';
    }
    if (style.inverse)
    {
        appendSep();
        out += '7';
    }
    if (style.strikethrough)
    {
        appendSep();
        out += '9';
    }

    if (!std::holds_alternative<std::monostate>(style.fg))
    {
        appendSep();
        appendColor(out, style.fg, 30);
    }

    if (!std::holds_alternative<std::monostate>(style.bg))
    {
        appendSep();
        appendColor(out, style.bg, 40);
    }

    out += 'm';
    return out;
}

auto wrap(std::string_view text, Style const& style) -> std::string
{
    if (style.empty())
        return std::string(text);

    auto const open = sgr(style);
    auto body = text;
    if (body.ends_with(ansi::Reset))
        body.remove_suffix(ansi::Reset.size());

    auto result = std::string {};
    result.reserve(open.size() + body.size() + ansi::Reset.size());
    result += open;

    // A reset inside the body would end our style early; re-open it.
    auto pos = std::size_t { 0 };
    while (pos < body.size())
    {
        auto const found = body.find(ansi::Reset, pos);
        if (found == std::string_view::npos)
            break;
        result.append(body.substr(pos, found - pos));
        result += ansi::Reset;
        result += open;
        pos = found + ansi::Reset.size();
    }
    result.append(body.substr(pos));
    result += ansi::Reset;
    return result;
}

auto parseStyle(std::string_view spec) -> Style
{
    auto style = Style {};

    for (auto const part: spec | std::views::split(' '))
    {
        auto token = std::string(part.begin(), part.end());
        std::ranges::transform(token, token.begin(), [](unsigned char c) {
            return c == '_' ? '-' : static_cast<char>(std::tolower(c));
        });
        if (token.empty())
            continue;

        if (token == "bold")
            style.bold = true;
        else if (token == "dim")
            style.dim = true;
        else if (token == "italic")
            style.italic = true;
        else if (token == "underline")
            style.underline = true;
        else if (token == "inverse")
            style.inverse = true;
        else if (token == "strikethrough")
            style.strikethrough = true;
        else if (token.starts_with("on-"))
        {
            if (auto const color = parseColor(std::string_view(token).substr(3)))
                style.bg = *color;
        }
        else if (auto const color = parseColor(token))
            style.fg = *color;
    }

    return style;
}

auto stripAnsi(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto i = std::size_t { 0 };
    while (i < text.size())
    {
        if (text[i] != '\033')
        {
            result += text[i++];
            continue;
        }

        ++i;
        if (i < text.size() && text[i] == '[')
        {
            ++i;
            while (i < text.size() && (static_cast<unsigned char>(text[i]) < 0x40 || static_cast<unsigned char>(text[i]) > 0x7E))
                ++i;
            ++i; // final byte
        }
        else if (i < text.size())
        {
            ++i; // two-byte escape such as ESC 7
        }
    }

    return result;
}

} // namespace chisel::tui
