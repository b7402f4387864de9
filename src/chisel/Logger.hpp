// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <io/Stdio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tui/Progress.hpp>
#include <tui/Prompt.hpp>
#include <tui/Spinner.hpp>
#include <tui/Theme.hpp>

namespace chisel
{

/// @brief When the Logger emits ANSI styling.
enum class ColorMode : std::uint8_t
{
    Always, ///< Style regardless of the output stream.
    Auto,   ///< Style only if the output stream is a terminal.
    Never,  ///< Never style.
};

/// @brief Parses "always", "auto" or "never".
[[nodiscard]] auto parseColorMode(std::string_view name) -> std::optional<ColorMode>;

/// @brief Returns the configuration name of @p mode.
[[nodiscard]] auto colorModeName(ColorMode mode) noexcept -> std::string_view;

/// @brief Appearance and behavior of a Logger.
struct LoggerOptions
{
    tui::Theme theme = tui::defaultTheme();
    ColorMode colorMode = ColorMode::Always;
    tui::SpinnerType spinner = tui::SpinnerType::Dots;
    std::chrono::milliseconds progressInterval { 0 }; ///< Zero selects the spinner's own interval.
    std::string mask = "******";
};

/// @brief Options of a free-text prompt.
struct PromptOptions
{
    std::optional<std::string> defaultValue;
    bool hidden = false;
};

/// @brief Styled messages, progress indicators and prompts on one stream pair.
///
/// The streams are captured from the I/O context at construction, so a Logger
/// created inside withOverrides() keeps using the overriding streams. Every
/// message method writes exactly one line.
class Logger
{
  public:
    /// @brief Creates a logger on the streams currently resolved by the I/O context.
    explicit Logger(LoggerOptions options = {});

    /// @brief Creates a logger on explicit streams, bypassing the I/O context.
    Logger(io::OutputStream& output, io::InputStream& input, LoggerOptions options = {});

    /// @brief Writes @p message as is, without a line feed.
    void write(std::string_view message);

    void info(std::string_view message);
    void err(std::string_view message);

    /// @brief Writes "[tag] message" in the warning style.
    void warn(std::string_view message, std::string_view tag = "WARN");

    void success(std::string_view message);
    void alert(std::string_view message);
    void detail(std::string_view message);

    /// @brief Queues @p message until the next flush().
    void delayed(std::string message);

    /// @brief Emits all queued messages in order through @p sink, or info() if none given.
    ///
    /// The queue is empty afterwards, so a second flush() emits nothing.
    void flush(std::function<void(std::string_view)> const& sink = {});

    /// @brief Returns the number of queued messages.
    [[nodiscard]] auto pendingCount() const noexcept -> std::size_t;

    /// @brief Starts a progress indicator on the output stream.
    [[nodiscard]] auto progress(std::string message) -> tui::Progress;

    /// @brief Asks for a line of text. See tui::Prompt::text().
    [[nodiscard]] auto prompt(std::string_view message, PromptOptions options = {}) -> std::string;

    /// @brief Asks a yes/no question. See tui::Prompt::confirm().
    [[nodiscard]] auto confirm(std::string_view message, bool defaultValue = false) -> bool;

    /// @brief Lets the user pick one of @p choices. See tui::Prompt::chooseOne().
    [[nodiscard]] auto chooseOne(std::string_view message,
                                 std::span<std::string const> choices,
                                 std::optional<std::string> defaultValue = std::nullopt) -> Result<std::string>;

    /// @brief Returns true if output is currently styled.
    [[nodiscard]] auto styling() const -> bool;

    [[nodiscard]] auto options() const noexcept -> LoggerOptions const& { return _options; }

    [[nodiscard]] auto output() const -> io::OutputStream& { return _streams.output(); }
    [[nodiscard]] auto input() const -> io::InputStream& { return _streams.input(); }

  private:
    io::StdioOverrides _streams;
    LoggerOptions _options;
    std::vector<std::string> _queue;

    void writeLine(std::string_view message, tui::Style const& style);
    [[nodiscard]] auto makePrompt() const -> tui::Prompt;
};

} // namespace chisel
