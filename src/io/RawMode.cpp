// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <utility>

#include <io/RawMode.hpp>

namespace chisel::io
{

RawModeSession::RawModeSession(InputStream* input,
                               bool previousLineMode,
                               bool previousEchoMode,
                               bool owning) noexcept:
    _input(input), _previousLineMode(previousLineMode), _previousEchoMode(previousEchoMode), _owning(owning)
{
}

auto RawModeSession::acquire(InputStream& input) -> Result<RawModeSession>
{
    if (!input.isTerminal())
        return makeError(ErrorCode::NotInteractive, "Raw mode requires a terminal input stream");

    auto const lineMode = input.lineMode();
    auto const echoMode = input.echoMode();

    if (!lineMode && !echoMode)
    {
        log::trace("Raw mode already active, acquiring nested session");
        return RawModeSession(&input, lineMode, echoMode, false);
    }

    if (echoMode)
    {
        if (auto result = input.setEchoMode(false); !result)
            return std::unexpected(result.error());
    }

    if (lineMode)
    {
        if (auto result = input.setLineMode(false); !result)
        {
            if (echoMode)
            {
                if (auto restored = input.setEchoMode(true); !restored)
                    log::warning("Failed to re-enable echo: {}", restored.error());
            }
            return std::unexpected(result.error());
        }
    }

    log::trace("Raw mode acquired (previous line mode: {}, echo: {})", lineMode, echoMode);
    return RawModeSession(&input, lineMode, echoMode, true);
}

RawModeSession::~RawModeSession()
{
    release();
}

RawModeSession::RawModeSession(RawModeSession&& other) noexcept:
    _input(std::exchange(other._input, nullptr)),
    _previousLineMode(other._previousLineMode),
    _previousEchoMode(other._previousEchoMode),
    _owning(std::exchange(other._owning, false))
{
}

auto RawModeSession::operator=(RawModeSession&& other) noexcept -> RawModeSession&
{
    if (this != &other)
    {
        release();
        _input = std::exchange(other._input, nullptr);
        _previousLineMode = other._previousLineMode;
        _previousEchoMode = other._previousEchoMode;
        _owning = std::exchange(other._owning, false);
    }
    return *this;
}

void RawModeSession::release()
{
    if (!_owning || _input == nullptr)
        return;
    _owning = false;

    if (_input->lineMode() != _previousLineMode)
    {
        if (auto result = _input->setLineMode(_previousLineMode); !result)
            log::warning("Failed to restore line mode: {}", result.error());
    }

    if (_input->echoMode() != _previousEchoMode)
    {
        if (auto result = _input->setEchoMode(_previousEchoMode); !result)
            log::warning("Failed to restore echo mode: {}", result.error());
    }

    log::trace("Raw mode released");
}

auto RawModeSession::owning() const noexcept -> bool
{
    return _owning;
}

auto RawModeSession::nested() const noexcept -> bool
{
    return _input != nullptr && !_owning && !_previousLineMode && !_previousEchoMode;
}

} // namespace chisel::io
