// SPDX-License-Identifier: Apache-2.0
#include <chisel/Logger.hpp>

#include <core/Log.hpp>

#include <format>

#include <tui/Prompt.hpp>
#include <tui/TerminalOutput.hpp>

namespace chisel
{

auto parseColorMode(std::string_view name) -> std::optional<ColorMode>
{
    if (name == "always")
        return ColorMode::Always;
    if (name == "auto")
        return ColorMode::Auto;
    if (name == "never")
        return ColorMode::Never;
    return std::nullopt;
}

auto colorModeName(ColorMode mode) noexcept -> std::string_view
{
    switch (mode)
    {
        case ColorMode::Always: return "always";
        case ColorMode::Auto: return "auto";
        case ColorMode::Never: return "never";
    }
    return "always";
}

Logger::Logger(LoggerOptions options): _streams(io::StdioOverrides::current()), _options(std::move(options))
{
}

Logger::Logger(io::OutputStream& output, io::InputStream& input, LoggerOptions options):
    _streams([&output]() -> io::OutputStream& { return output; },
             [&input]() -> io::InputStream& { return input; },
             io::StdioOverrides {}),
    _options(std::move(options))
{
}

auto Logger::styling() const -> bool
{
    switch (_options.colorMode)
    {
        case ColorMode::Always: return true;
        case ColorMode::Never: return false;
        case ColorMode::Auto: return _streams.output().isTerminal();
    }
    return true;
}

void Logger::writeLine(std::string_view message, tui::Style const& style)
{
    auto out = tui::TerminalOutput(_streams.output(), styling());
    out.writeLine(message, style);
    out.flush();
}

void Logger::write(std::string_view message)
{
    auto& stream = _streams.output();
    stream.write(message);
    stream.flush();
}

void Logger::info(std::string_view message)
{
    writeLine(message, {});
}

void Logger::err(std::string_view message)
{
    writeLine(message, _options.theme.error);
}

void Logger::warn(std::string_view message, std::string_view tag)
{
    writeLine(std::format("[{}] {}", tag, message), _options.theme.warning);
}

void Logger::success(std::string_view message)
{
    writeLine(message, _options.theme.success);
}

void Logger::alert(std::string_view message)
{
    writeLine(message, _options.theme.alert);
}

void Logger::detail(std::string_view message)
{
    writeLine(message, _options.theme.detail);
}

void Logger::delayed(std::string message)
{
    _queue.push_back(std::move(message));
}

void Logger::flush(std::function<void(std::string_view)> const& sink)
{
    // Swap first so a sink that queues again does not feed this loop.
    auto pending = std::vector<std::string> {};
    pending.swap(_queue);

    log::trace("Flushing {} delayed message(s)", pending.size());
    for (auto const& message: pending)
    {
        if (sink)
            sink(message);
        else
            info(message);
    }
}

auto Logger::pendingCount() const noexcept -> std::size_t
{
    return _queue.size();
}

auto Logger::progress(std::string message) -> tui::Progress
{
    return tui::Progress(_streams.output(),
                         std::move(message),
                         tui::ProgressOptions {
                             .spinner = _options.spinner,
                             .interval = _options.progressInterval,
                             .theme = _options.theme,
                             .styled = styling(),
                         });
}

auto Logger::makePrompt() const -> tui::Prompt
{
    return tui::Prompt(_streams.output(),
                       _streams.input(),
                       tui::PromptOptions { .theme = _options.theme, .styled = styling(), .mask = _options.mask });
}

auto Logger::prompt(std::string_view message, PromptOptions options) -> std::string
{
    auto prompter = makePrompt();
    return prompter.text(message, std::move(options.defaultValue), options.hidden);
}

auto Logger::confirm(std::string_view message, bool defaultValue) -> bool
{
    auto prompter = makePrompt();
    return prompter.confirm(message, defaultValue);
}

auto Logger::chooseOne(std::string_view message,
                       std::span<std::string const> choices,
                       std::optional<std::string> defaultValue) -> Result<std::string>
{
    auto prompter = makePrompt();
    return prompter.chooseOne(message, choices, std::move(defaultValue));
}

} // namespace chisel
