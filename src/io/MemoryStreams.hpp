// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <io/Stdio.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace chisel::io
{

/// @brief Output stream capturing everything written into a string.
///
/// Thread-safe, so a running Progress ticker may write to it concurrently
/// with the test reading it.
class StringOutputStream final: public OutputStream
{
  public:
    /// @param terminal Value reported by isTerminal().
    /// @param columns Value reported by columns().
    explicit StringOutputStream(bool terminal = true, int columns = 80);

    void write(std::string_view text) override;
    void flush() override;
    [[nodiscard]] auto isTerminal() const -> bool override;
    [[nodiscard]] auto columns() const -> int override;
    [[nodiscard]] auto atLineStart() const -> bool override;

    /// @brief Returns a copy of everything written so far.
    [[nodiscard]] auto str() const -> std::string;

    /// @brief Returns the number of write() calls seen so far.
    [[nodiscard]] auto writeCount() const -> std::size_t;

    /// @brief Discards the captured text.
    void clear();

  private:
    mutable std::mutex _mutex;
    std::string _buffer;
    std::size_t _writes = 0;
    bool _atLineStart = true;
    bool _terminal;
    int _columns;
};

/// @brief Input stream serving a fixed byte sequence, then end of stream.
///
/// Line and echo mode are plain flags. Every change is recorded so tests can
/// check the exact sequence of mode transitions.
class StringInputStream final: public InputStream
{
  public:
    /// @brief A recorded mode transition.
    struct ModeChange
    {
        bool lineMode;
        bool echoMode;
    };

    /// @param data The bytes to serve.
    /// @param terminal Whether the stream claims to be a terminal. Mode changes fail if not.
    explicit StringInputStream(std::string data = {}, bool terminal = true);

    [[nodiscard]] auto readLine() -> std::optional<std::string> override;
    [[nodiscard]] auto readByte() -> std::optional<std::uint8_t> override;
    [[nodiscard]] auto lineMode() const -> bool override;
    [[nodiscard]] auto echoMode() const -> bool override;
    [[nodiscard]] auto setLineMode(bool enabled) -> VoidResult override;
    [[nodiscard]] auto setEchoMode(bool enabled) -> VoidResult override;
    [[nodiscard]] auto isTerminal() const -> bool override;

    /// @brief Appends more bytes to serve.
    void feed(std::string_view data);

    /// @brief Returns the recorded mode transitions.
    [[nodiscard]] auto modeChanges() const noexcept -> std::vector<ModeChange> const&;

    /// @brief Returns the number of bytes not consumed yet.
    [[nodiscard]] auto remaining() const noexcept -> std::size_t;

  private:
    std::string _data;
    std::size_t _pos = 0;
    bool _terminal;
    bool _lineMode = true;
    bool _echoMode = true;
    std::vector<ModeChange> _changes;
};

} // namespace chisel::io
