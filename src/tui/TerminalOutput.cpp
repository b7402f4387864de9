// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <format>

#include <tui/TerminalOutput.hpp>
#include <tui/Utf8.hpp>

namespace chisel::tui
{

TerminalOutput::TerminalOutput(io::OutputStream& stream, bool styled): _stream(stream), _styled(styled)
{
}

TerminalOutput::~TerminalOutput()
{
    flush();
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    if (_styled)
        _buffer += wrap(text, style);
    else
        _buffer.append(text);
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::writeLine(std::string_view text, Style const& style)
{
    write(text, style);
    _buffer += '\n';
}

auto TerminalOutput::styled(std::string_view text, Style const& style) const -> std::string
{
    if (!_styled)
        return std::string(text);
    return wrap(text, style);
}

void TerminalOutput::moveUp(int n)
{
    if (n == 1)
        _buffer += ansi::CursorUp;
    else if (n > 1)
        _buffer += std::format("\033[{}A", n);
}

void TerminalOutput::carriageReturn()
{
    _buffer += ansi::CarriageReturn;
}

void TerminalOutput::clearLine()
{
    _buffer += ansi::ClearLine;
}

void TerminalOutput::clearToEndOfScreen()
{
    _buffer += ansi::ClearToEndOfScreen;
}

void TerminalOutput::eraseRows(int rows)
{
    if (rows <= 0)
        return;

    carriageReturn();
    clearLine();
    for (auto i = 1; i < rows; ++i)
    {
        moveUp();
        clearLine();
    }
}

void TerminalOutput::showCursor()
{
    _buffer += ansi::ShowCursor;
}

void TerminalOutput::hideCursor()
{
    _buffer += ansi::HideCursor;
}

void TerminalOutput::saveCursor()
{
    _buffer += ansi::SaveCursor;
}

void TerminalOutput::restoreCursor()
{
    _buffer += ansi::RestoreCursor;
}

void TerminalOutput::flush()
{
    if (!_buffer.empty())
    {
        _stream.write(_buffer);
        _buffer.clear();
    }
    _stream.flush();
}

auto TerminalOutput::columns() const -> int
{
    return _stream.columns();
}

auto TerminalOutput::styling() const noexcept -> bool
{
    return _styled;
}

auto lineBreaks(std::string_view text) -> int
{
    return static_cast<int>(std::ranges::count(text, '\n'));
}

auto rowsSpanned(std::string_view text, int columns) -> int
{
    auto const visible = stripAnsi(text);
    auto const width = std::max(1, columns);
    auto const view = std::string_view(visible);

    auto rows = 0;
    auto start = std::size_t { 0 };
    for (;;)
    {
        auto const end = view.find('\n', start);
        auto const segment = view.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        auto const cells = displayWidth(segment);
        rows += std::max(1, (cells + width - 1) / width);
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return rows;
}

} // namespace chisel::tui
