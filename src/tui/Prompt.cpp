// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <io/RawMode.hpp>

#include <tui/KeyWindow.hpp>
#include <tui/Prompt.hpp>
#include <tui/TerminalOutput.hpp>
#include <tui/Utf8.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <format>
#include <iterator>

namespace chisel::tui
{

namespace
{
    constexpr auto Whitespace = std::string_view { " \t\r\n\v\f" };

    constexpr auto YesAnswers = std::array<std::string_view, 6> { "y", "yes", "yea", "yeah", "yep", "yup" };
    constexpr auto NoAnswers = std::array<std::string_view, 3> { "n", "no", "nope" };

    // Raw input bytes of interest while reading without echo.
    constexpr std::uint8_t LineFeed = 0x0A;
    constexpr std::uint8_t CarriageReturn = 0x0D;
    constexpr std::uint8_t Backspace = 0x08;
    constexpr std::uint8_t Delete = 0x7F;
    constexpr std::uint8_t EndOfTransmission = 0x04; // Ctrl+D, delivered as a byte in raw mode.

    constexpr auto PointerGlyph = std::string_view { "\u276F" };    // ❯
    constexpr auto SelectedGlyph = std::string_view { "\u25C9" };   // ◉
    constexpr auto UnselectedGlyph = std::string_view { "\u25EF" }; // ◯

    /// Shows the cursor again when a choice list is left by anything but a regular answer.
    class CursorRestorer
    {
      public:
        explicit CursorRestorer(io::OutputStream& stream): _stream(stream) {}

        ~CursorRestorer()
        {
            if (!_armed)
                return;
            _stream.write(ansi::ShowCursor);
            _stream.flush();
        }

        CursorRestorer(CursorRestorer const&) = delete;
        auto operator=(CursorRestorer const&) -> CursorRestorer& = delete;

        void disarm() noexcept { _armed = false; }

      private:
        io::OutputStream& _stream;
        bool _armed = true;
    };

    void renderChoices(TerminalOutput& out,
                       Theme const& theme,
                       std::string_view message,
                       std::span<std::string const> choices,
                       std::size_t index)
    {
        auto frame = std::string(message);
        for (auto i = std::size_t { 0 }; i < choices.size(); ++i)
        {
            frame += '\n';
            if (i == index)
                frame += std::format("{} {} {}",
                                     out.styled(PointerGlyph, theme.pointer),
                                     out.styled(SelectedGlyph, theme.selected),
                                     out.styled(choices[i], theme.selected));
            else
                frame += std::format("  {} {}", UnselectedGlyph, choices[i]);
        }
        out.writeRaw(frame);
    }
} // namespace

auto parseAnswer(std::string_view answer) -> std::optional<bool>
{
    auto lowered = std::string(answer);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });

    if (std::ranges::find(YesAnswers, lowered) != YesAnswers.end())
        return true;
    if (std::ranges::find(NoAnswers, lowered) != NoAnswers.end())
        return false;
    return std::nullopt;
}

auto trim(std::string_view text) -> std::string_view
{
    auto const first = text.find_first_not_of(Whitespace);
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(Whitespace);
    return text.substr(first, last - first + 1);
}

Prompt::Prompt(io::OutputStream& output, io::InputStream& input, PromptOptions options):
    _output(output), _input(input), _options(std::move(options))
{
}

auto Prompt::text(std::string_view message, std::optional<std::string> defaultValue, bool hidden) -> std::string
{
    auto const fallback = defaultValue.value_or(std::string {});

    auto promptLine = std::string(message);
    {
        auto out = TerminalOutput(_output, _options.styled);
        if (!fallback.empty())
            promptLine += ' ' + out.styled(std::format("({})", fallback), _options.theme.hint);
        promptLine += ' ';
        out.writeRaw(promptLine);
        out.flush();
    }

    auto const answer = hidden ? readHiddenAnswer() : readAnswer();

    auto response = fallback;
    if (answer.line)
    {
        auto const value = hidden ? std::string_view(*answer.line) : trim(*answer.line);
        if (!value.empty())
            response = std::string(value);
    }

    finish(promptLine, answer, hidden && !response.empty() ? _options.mask : response);
    return response;
}

auto Prompt::confirm(std::string_view message, bool defaultValue) -> bool
{
    auto promptLine = std::string(message);
    {
        auto out = TerminalOutput(_output, _options.styled);
        promptLine += ' ' + out.styled(defaultValue ? "(Y/n)" : "(y/N)", _options.theme.hint) + ' ';
        out.writeRaw(promptLine);
        out.flush();
    }

    auto const answer = readAnswer();
    auto response = defaultValue;
    if (answer.line)
        response = parseAnswer(trim(*answer.line)).value_or(defaultValue);

    finish(promptLine, answer, response ? "Yes" : "No");
    return response;
}

auto Prompt::chooseOne(std::string_view message,
                       std::span<std::string const> choices,
                       std::optional<std::string> defaultValue) -> Result<std::string>
{
    if (choices.empty())
        return makeError(ErrorCode::InvalidArgument, "chooseOne requires at least one choice");

    auto session = io::RawModeSession::acquire(_input);
    if (!session)
        return makeError(session.error().code, std::format("Cannot present choices: {}", session.error().message));

    auto initialIndex = std::size_t { 0 };
    if (defaultValue)
    {
        auto const found = std::ranges::find(choices, *defaultValue);
        if (found != choices.end())
            initialIndex = static_cast<std::size_t>(std::distance(choices.begin(), found));
    }
    auto index = initialIndex;
    auto const count = choices.size();

    auto cursor = CursorRestorer(_output);
    {
        auto out = TerminalOutput(_output, _options.styled);
        out.saveCursor();
        out.hideCursor();
        renderChoices(out, _options.theme, message, choices, index);
        out.flush();
    }

    auto window = KeyWindow {};
    for (;;)
    {
        auto const byte = _input.readByte();
        if (!byte || *byte == EndOfTransmission)
        {
            log::debug("End of input while choosing, keeping '{}'", choices[initialIndex]);
            index = initialIndex;
            break;
        }

        auto const key = window.feed(*byte);
        if (!key)
            continue;

        log::trace("Choice list key: {}", keyName(*key));
        if (*key == Key::Enter)
            break;

        index = *key == Key::Up ? (index + count - 1) % count : (index + 1) % count;

        auto out = TerminalOutput(_output, _options.styled);
        out.restoreCursor();
        out.clearToEndOfScreen();
        renderChoices(out, _options.theme, message, choices, index);
        out.flush();
    }

    {
        auto out = TerminalOutput(_output, _options.styled);
        out.restoreCursor();
        out.clearToEndOfScreen();
        out.showCursor();
        out.writeRaw(message);
        out.writeRaw(" ");
        out.writeLine(choices[index], _options.theme.answer);
        out.flush();
    }
    cursor.disarm();
    session->release();

    return choices[index];
}

auto Prompt::readAnswer() -> Answer
{
    auto line = _input.readLine();
    auto const echoed = line.has_value() && _input.isTerminal() && _input.echoMode();
    return Answer { std::move(line), echoed };
}

auto Prompt::readHiddenAnswer() -> Answer
{
    if (!_input.isTerminal())
    {
        log::debug("Hidden input requested on a non-interactive stream, reading a plain line");
        return Answer { _input.readLine(), false };
    }

    auto session = io::RawModeSession::acquire(_input);
    if (!session)
    {
        log::debug("Cannot disable echo for hidden input: {}", session.error());
        return Answer { _input.readLine(), false };
    }

    auto value = std::string {};
    auto received = false;
    for (;;)
    {
        auto const byte = _input.readByte();
        if (!byte || *byte == EndOfTransmission)
        {
            if (!received)
                return Answer { std::nullopt, false };
            break;
        }
        received = true;

        if (*byte == LineFeed || *byte == CarriageReturn)
            break;

        if (*byte == Delete || *byte == Backspace)
        {
            if (!value.empty())
                value.erase(lastGraphemeClusterStart(value));
            continue;
        }

        value.push_back(static_cast<char>(*byte));
    }

    session->release();
    return Answer { std::move(value), false };
}

void Prompt::finish(std::string_view promptLine, Answer const& answer, std::string_view shown)
{
    auto out = TerminalOutput(_output, _options.styled);

    // The terminal already moved to the next row if it echoed the line.
    // Otherwise move there ourselves so both cases erase the same way.
    auto typed = std::string(promptLine);
    if (answer.echoed)
        typed += *answer.line;
    else
        out.writeRaw("\n");
    typed += '\n';

    out.eraseRows(rowsSpanned(typed, out.columns()));
    out.writeRaw(promptLine);
    out.writeLine(shown, _options.theme.answer);
    out.flush();
}

} // namespace chisel::tui
