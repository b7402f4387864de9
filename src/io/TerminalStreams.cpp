// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <sys/ioctl.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>

#include <termios.h>
#include <unistd.h>

#include <io/TerminalStreams.hpp>

namespace chisel::io
{

namespace
{
    constexpr auto ShowCursor = "\033[?25h";
    constexpr auto GuardedSignals = std::array { SIGINT, SIGTERM, SIGHUP };

    // State shared with the signal handler. Only one terminal input is guarded at a time.
    int gGuardedFd = -1;                                          // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct termios gGuardedTermios {};                            // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    std::array<struct sigaction, GuardedSignals.size()> gPrevious {}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void restoreOnSignal(int sig)
    {
        if (gGuardedFd != -1)
            tcsetattr(gGuardedFd, TCSANOW, &gGuardedTermios);
        static_cast<void>(::write(STDOUT_FILENO, ShowCursor, std::strlen(ShowCursor)));

        for (auto i = std::size_t { 0 }; i < GuardedSignals.size(); ++i)
        {
            if (GuardedSignals[i] == sig)
                sigaction(sig, &gPrevious[i], nullptr);
        }
        raise(sig);
    }

    void installInterruptGuard(int fd, struct termios const& original)
    {
        if (gGuardedFd == fd)
            return;

        gGuardedTermios = original;
        gGuardedFd = fd;

        struct sigaction sa {};
        sa.sa_handler = restoreOnSignal;
        sa.sa_flags = 0;
        sigemptyset(&sa.sa_mask);
        for (auto i = std::size_t { 0 }; i < GuardedSignals.size(); ++i)
            sigaction(GuardedSignals[i], &sa, &gPrevious[i]);
        log::trace("Installed interrupt guard for fd {}", fd);
    }

    void removeInterruptGuard(int fd)
    {
        if (gGuardedFd != fd)
            return;

        for (auto i = std::size_t { 0 }; i < GuardedSignals.size(); ++i)
            sigaction(GuardedSignals[i], &gPrevious[i], nullptr);
        gGuardedFd = -1;
        log::trace("Removed interrupt guard for fd {}", fd);
    }

    [[nodiscard]] auto sameModes(struct termios const& a, struct termios const& b) -> bool
    {
        constexpr auto Mask = static_cast<tcflag_t>(ICANON | ECHO);
        return (a.c_lflag & Mask) == (b.c_lflag & Mask);
    }
} // namespace

// --- FdOutputStream ---

FdOutputStream::FdOutputStream(int fd) noexcept: _fd(fd)
{
}

void FdOutputStream::write(std::string_view text)
{
    if (!text.empty())
        _atLineStart = text.back() == '\n';

    while (!text.empty())
    {
        auto const n = ::write(_fd, text.data(), text.size());
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return;
        }
        text.remove_prefix(static_cast<std::size_t>(n));
    }
}

void FdOutputStream::flush()
{
    // Writes go straight to the descriptor.
}

auto FdOutputStream::isTerminal() const -> bool
{
    return isatty(_fd) == 1;
}

auto FdOutputStream::columns() const -> int
{
    auto ws = winsize {};
    if (ioctl(_fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

auto FdOutputStream::atLineStart() const -> bool
{
    return _atLineStart;
}

// --- FdInputStream ---

FdInputStream::FdInputStream(int fd) noexcept: _fd(fd)
{
}

FdInputStream::~FdInputStream()
{
    if (_haveOrigTermios)
    {
        auto current = termios {};
        if (tcgetattr(_fd, &current) == 0 && !sameModes(current, _origTermios))
            tcsetattr(_fd, TCSANOW, &_origTermios);
        removeInterruptGuard(_fd);
    }
}

auto FdInputStream::readLine() -> std::optional<std::string>
{
    auto line = std::string {};
    auto sawAny = false;
    while (auto const byte = readByte())
    {
        sawAny = true;
        if (*byte == '\n')
            break;
        line.push_back(static_cast<char>(*byte));
    }

    if (!sawAny)
        return std::nullopt;

    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

auto FdInputStream::readByte() -> std::optional<std::uint8_t>
{
    auto byte = std::uint8_t {};
    for (;;)
    {
        auto const n = ::read(_fd, &byte, 1);
        if (n == 1)
            return byte;
        if (n < 0 && errno == EINTR)
            continue;
        return std::nullopt;
    }
}

auto FdInputStream::lineMode() const -> bool
{
    return hasFlag(ICANON, true);
}

auto FdInputStream::echoMode() const -> bool
{
    return hasFlag(ECHO, true);
}

auto FdInputStream::setLineMode(bool enabled) -> VoidResult
{
    return updateFlag(ICANON, enabled);
}

auto FdInputStream::setEchoMode(bool enabled) -> VoidResult
{
    return updateFlag(ECHO, enabled);
}

auto FdInputStream::isTerminal() const -> bool
{
    return isatty(_fd) == 1;
}

auto FdInputStream::hasFlag(tcflag_t flag, bool fallback) const -> bool
{
    auto attrs = termios {};
    if (tcgetattr(_fd, &attrs) != 0)
        return fallback;
    return (attrs.c_lflag & flag) != 0;
}

auto FdInputStream::updateFlag(tcflag_t flag, bool enabled) -> VoidResult
{
    auto attrs = termios {};
    if (tcgetattr(_fd, &attrs) != 0)
        return makeError(ErrorCode::NotInteractive,
                         std::format("Input (fd {}) is not a terminal: {}", _fd, std::strerror(errno)));

    if (!_haveOrigTermios)
    {
        _origTermios = attrs;
        _haveOrigTermios = true;
    }

    if (enabled)
        attrs.c_lflag |= flag;
    else
        attrs.c_lflag &= ~flag;

    if (flag == ICANON && !enabled)
    {
        // Blocking single byte reads.
        attrs.c_cc[VMIN] = 1;
        attrs.c_cc[VTIME] = 0;
    }

    if (tcsetattr(_fd, TCSANOW, &attrs) != 0)
    {
        log::warning("tcsetattr failed on fd {}: {}", _fd, std::strerror(errno));
        return makeError(ErrorCode::IoError, std::format("Failed to set terminal attributes: {}", std::strerror(errno)));
    }

    if (sameModes(attrs, _origTermios))
        removeInterruptGuard(_fd);
    else
        installInterruptGuard(_fd, _origTermios);

    return {};
}

} // namespace chisel::io
