// SPDX-License-Identifier: Apache-2.0
#include <io/MemoryStreams.hpp>

namespace chisel::io
{

// --- StringOutputStream ---

StringOutputStream::StringOutputStream(bool terminal, int columns): _terminal(terminal), _columns(columns)
{
}

void StringOutputStream::write(std::string_view text)
{
    auto const lock = std::lock_guard(_mutex);
    _buffer.append(text);
    ++_writes;
    if (!text.empty())
        _atLineStart = text.back() == '\n';
}

void StringOutputStream::flush()
{
}

auto StringOutputStream::isTerminal() const -> bool
{
    return _terminal;
}

auto StringOutputStream::columns() const -> int
{
    return _columns;
}

auto StringOutputStream::atLineStart() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _atLineStart;
}

auto StringOutputStream::str() const -> std::string
{
    auto const lock = std::lock_guard(_mutex);
    return _buffer;
}

auto StringOutputStream::writeCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _writes;
}

void StringOutputStream::clear()
{
    auto const lock = std::lock_guard(_mutex);
    _buffer.clear();
}

// --- StringInputStream ---

StringInputStream::StringInputStream(std::string data, bool terminal): _data(std::move(data)), _terminal(terminal)
{
}

auto StringInputStream::readLine() -> std::optional<std::string>
{
    if (_pos >= _data.size())
        return std::nullopt;

    auto const end = _data.find('\n', _pos);
    auto line = std::string {};
    if (end == std::string::npos)
    {
        line = _data.substr(_pos);
        _pos = _data.size();
    }
    else
    {
        line = _data.substr(_pos, end - _pos);
        _pos = end + 1;
    }

    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

auto StringInputStream::readByte() -> std::optional<std::uint8_t>
{
    if (_pos >= _data.size())
        return std::nullopt;
    return static_cast<std::uint8_t>(_data[_pos++]);
}

auto StringInputStream::lineMode() const -> bool
{
    return _lineMode;
}

auto StringInputStream::echoMode() const -> bool
{
    return _echoMode;
}

auto StringInputStream::setLineMode(bool enabled) -> VoidResult
{
    if (!_terminal)
        return makeError(ErrorCode::NotInteractive, "Input is not a terminal");
    _lineMode = enabled;
    _changes.push_back(ModeChange { .lineMode = _lineMode, .echoMode = _echoMode });
    return {};
}

auto StringInputStream::setEchoMode(bool enabled) -> VoidResult
{
    if (!_terminal)
        return makeError(ErrorCode::NotInteractive, "Input is not a terminal");
    _echoMode = enabled;
    _changes.push_back(ModeChange { .lineMode = _lineMode, .echoMode = _echoMode });
    return {};
}

auto StringInputStream::isTerminal() const -> bool
{
    return _terminal;
}

void StringInputStream::feed(std::string_view data)
{
    _data.append(data);
}

auto StringInputStream::modeChanges() const noexcept -> std::vector<ModeChange> const&
{
    return _changes;
}

auto StringInputStream::remaining() const noexcept -> std::size_t
{
    return _data.size() - _pos;
}

} // namespace chisel::io
