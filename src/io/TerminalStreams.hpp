// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <io/Stdio.hpp>

#include <termios.h>

namespace chisel::io
{

/// @brief Unbuffered output stream writing to a POSIX file descriptor.
class FdOutputStream final: public OutputStream
{
  public:
    explicit FdOutputStream(int fd) noexcept;

    void write(std::string_view text) override;
    void flush() override;
    [[nodiscard]] auto isTerminal() const -> bool override;
    [[nodiscard]] auto columns() const -> int override;
    [[nodiscard]] auto atLineStart() const -> bool override;

  private:
    int _fd;
    bool _atLineStart = true;
};

/// @brief Input stream reading from a POSIX file descriptor.
///
/// Line and echo mode map to the termios ICANON and ECHO bits. While the
/// attributes differ from the ones found before the first change, SIGINT,
/// SIGTERM and SIGHUP handlers are installed that restore the original
/// attributes and show the cursor before the signal's previous disposition
/// runs.
class FdInputStream final: public InputStream
{
  public:
    explicit FdInputStream(int fd) noexcept;
    ~FdInputStream() override;

    FdInputStream(FdInputStream const&) = delete;
    auto operator=(FdInputStream const&) -> FdInputStream& = delete;
    FdInputStream(FdInputStream&&) = delete;
    auto operator=(FdInputStream&&) -> FdInputStream& = delete;

    [[nodiscard]] auto readLine() -> std::optional<std::string> override;
    [[nodiscard]] auto readByte() -> std::optional<std::uint8_t> override;
    [[nodiscard]] auto lineMode() const -> bool override;
    [[nodiscard]] auto echoMode() const -> bool override;
    [[nodiscard]] auto setLineMode(bool enabled) -> VoidResult override;
    [[nodiscard]] auto setEchoMode(bool enabled) -> VoidResult override;
    [[nodiscard]] auto isTerminal() const -> bool override;

  private:
    int _fd;
    struct termios _origTermios {};
    bool _haveOrigTermios = false;

    [[nodiscard]] auto updateFlag(tcflag_t flag, bool enabled) -> VoidResult;
    [[nodiscard]] auto hasFlag(tcflag_t flag, bool fallback) const -> bool;
};

} // namespace chisel::io
