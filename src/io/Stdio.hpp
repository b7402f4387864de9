// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chisel::io
{

/// @brief Abstract interface for the stream a Logger writes to.
class OutputStream
{
  public:
    virtual ~OutputStream() = default;

    /// @brief Writes text verbatim, including escape sequences.
    ///
    /// A single call is never split by the engine, so one call per frame keeps
    /// escape sequences of concurrent writers from interleaving.
    virtual void write(std::string_view text) = 0;

    /// @brief Flushes any buffering done by the underlying stream.
    virtual void flush() = 0;

    /// @brief Returns true if the stream is attached to a terminal.
    [[nodiscard]] virtual auto isTerminal() const -> bool = 0;

    /// @brief Returns the terminal width in columns (80 if unknown).
    [[nodiscard]] virtual auto columns() const -> int = 0;

    /// @brief Returns true if nothing was written yet or the last write ended with a line feed.
    [[nodiscard]] virtual auto atLineStart() const -> bool = 0;
};

/// @brief Abstract interface for the stream prompts read from.
class InputStream
{
  public:
    virtual ~InputStream() = default;

    /// @brief Reads one line without its terminator (blocking).
    /// @return The line, or std::nullopt at end of stream.
    [[nodiscard]] virtual auto readLine() -> std::optional<std::string> = 0;

    /// @brief Reads a single byte (blocking).
    /// @return The byte, or std::nullopt at end of stream.
    [[nodiscard]] virtual auto readByte() -> std::optional<std::uint8_t> = 0;

    /// @brief Returns true if input is line buffered (canonical mode).
    [[nodiscard]] virtual auto lineMode() const -> bool = 0;

    /// @brief Returns true if typed characters are echoed.
    [[nodiscard]] virtual auto echoMode() const -> bool = 0;

    /// @brief Enables or disables line buffering.
    /// @return Success, or NotInteractive if the stream is not a terminal.
    [[nodiscard]] virtual auto setLineMode(bool enabled) -> VoidResult = 0;

    /// @brief Enables or disables echo.
    /// @return Success, or NotInteractive if the stream is not a terminal.
    [[nodiscard]] virtual auto setEchoMode(bool enabled) -> VoidResult = 0;

    /// @brief Returns true if the stream is attached to a terminal.
    [[nodiscard]] virtual auto isTerminal() const -> bool = 0;
};

using OutputProvider = std::function<OutputStream&()>;
using InputProvider = std::function<InputStream&()>;

/// @brief Returns the process' standard output stream.
[[nodiscard]] auto standardOutput() -> OutputStream&;

/// @brief Returns the process' standard input stream.
[[nodiscard]] auto standardInput() -> InputStream&;

/// @brief The effective stream providers of one override scope.
///
/// Values are cheap to copy. A Logger stores the instance that was current at
/// its construction so it keeps using the scope's streams after the scope
/// ended or from another thread.
class StdioOverrides
{
  public:
    /// @brief Constructs the default pair resolving to the real terminal streams.
    StdioOverrides();

    /// @brief Constructs a pair; empty providers inherit from @p parent.
    StdioOverrides(OutputProvider output, InputProvider input, StdioOverrides const& parent);

    /// @brief Returns the overrides of the innermost active scope on this thread.
    ///
    /// With no scope active this resolves to the real terminal streams.
    [[nodiscard]] static auto current() -> StdioOverrides;

    /// @brief Returns true if at least one override scope is active on this thread.
    [[nodiscard]] static auto active() noexcept -> bool;

    [[nodiscard]] auto output() const -> OutputStream&;
    [[nodiscard]] auto input() const -> InputStream&;

  private:
    OutputProvider _output;
    InputProvider _input;
};

/// @brief RAII guard that pushes an override scope and pops it on destruction.
///
/// Scopes nest; popping restores the parent's resolution, not the default.
class ScopedOverrides
{
  public:
    ScopedOverrides(OutputProvider output, InputProvider input);
    ~ScopedOverrides();

    ScopedOverrides(ScopedOverrides const&) = delete;
    auto operator=(ScopedOverrides const&) -> ScopedOverrides& = delete;
    ScopedOverrides(ScopedOverrides&&) = delete;
    auto operator=(ScopedOverrides&&) -> ScopedOverrides& = delete;

  private:
    StdioOverrides _overrides;
    ScopedOverrides* _parent;

    friend class StdioOverrides;
};

/// @brief Returns the output stream of the innermost active scope.
[[nodiscard]] auto resolveOutput() -> OutputStream&;

/// @brief Returns the input stream of the innermost active scope.
[[nodiscard]] auto resolveInput() -> InputStream&;

/// @brief Runs @p body with the given providers active.
///
/// The previous resolution is restored when @p body returns or throws.
/// Either provider may be empty to keep the enclosing scope's stream.
template <typename Body>
auto withOverrides(OutputProvider output, InputProvider input, Body&& body) -> decltype(body())
{
    auto const scope = ScopedOverrides(std::move(output), std::move(input));
    return std::forward<Body>(body)();
}

/// @brief Convenience overload binding stream references for the scope.
template <typename Body>
auto withStreams(OutputStream& output, InputStream& input, Body&& body) -> decltype(body())
{
    return withOverrides([&output]() -> OutputStream& { return output; },
                         [&input]() -> InputStream& { return input; },
                         std::forward<Body>(body));
}

} // namespace chisel::io
