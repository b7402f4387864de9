// SPDX-License-Identifier: Apache-2.0
#include <tui/Progress.hpp>
#include <tui/TerminalOutput.hpp>

#include <condition_variable>
#include <format>
#include <mutex>
#include <string_view>
#include <thread>

namespace chisel::tui
{

namespace
{
    constexpr auto SuccessGlyph = std::string_view { "\u2713" };  // ✓
    constexpr auto FailureGlyph = std::string_view { "\u2717" };  // ✗
    constexpr auto CanceledGlyph = std::string_view { "\u2298" }; // ⊘
} // namespace

struct Progress::Impl
{
    Impl(io::OutputStream& stream, std::string message, ProgressOptions options):
        stream(stream), options(std::move(options)), message(std::move(message)), spinner(this->options.spinner)
    {
    }

    io::OutputStream& stream;
    ProgressOptions options;
    std::string message;
    Spinner spinner;

    // Guards everything below and serializes all writes to the stream.
    mutable std::mutex mutex;
    std::condition_variable wake;
    ProgressState state = ProgressState::Idle;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point endTime;
    int renderedRows = 0;
    std::thread ticker;

    [[nodiscard]] auto elapsedLocked() const -> std::chrono::milliseconds
    {
        auto const end = state == ProgressState::Running || state == ProgressState::Idle
                             ? std::chrono::steady_clock::now()
                             : endTime;
        return std::chrono::duration_cast<std::chrono::milliseconds>(end - startTime);
    }

    /// @brief Redraws the line. Must be called with the mutex held.
    ///
    /// With @p newRow set, the frame first moves to a fresh row so that erasing
    /// never reaches text the caller left on the current one.
    void render(std::string_view glyph, Style const& glyphStyle, bool final, bool newRow = false)
    {
        auto out = TerminalOutput(stream, options.styled);
        if (newRow)
            out.writeRaw("\n");
        out.eraseRows(renderedRows);

        auto line = out.styled(glyph, glyphStyle);
        line += ' ';
        line += message;
        if (!final)
            line += "...";
        line += ' ';
        line += out.styled(formatElapsed(elapsedLocked()), options.theme.elapsed);
        out.writeRaw(line);

        if (final)
        {
            out.writeRaw("\n");
            renderedRows = 0;
        }
        else
        {
            renderedRows = rowsSpanned(line, out.columns());
        }
        out.flush();
    }

    void start()
    {
        {
            auto const lock = std::lock_guard(mutex);
            startTime = std::chrono::steady_clock::now();
            state = ProgressState::Running;
            render(spinner.currentFrame(), options.theme.spinner, false, !stream.atLineStart());
        }

        auto const interval = options.interval.count() > 0 ? options.interval : spinnerInterval(options.spinner);
        ticker = std::thread([this, interval] {
            auto lock = std::unique_lock(mutex);
            while (state == ProgressState::Running)
            {
                if (wake.wait_for(lock, interval, [this] { return state != ProgressState::Running; }))
                    break;
                spinner.advance();
                render(spinner.currentFrame(), options.theme.spinner, false);
            }
        });
    }

    void finish(ProgressState outcome, std::optional<std::string> finalMessage)
    {
        {
            auto const lock = std::lock_guard(mutex);
            if (state != ProgressState::Running)
                return;

            state = outcome;
            endTime = std::chrono::steady_clock::now();
            if (finalMessage)
                message = std::move(*finalMessage);

            switch (outcome)
            {
                case ProgressState::Succeeded: render(SuccessGlyph, options.theme.progressSuccess, true); break;
                case ProgressState::Failed: render(FailureGlyph, options.theme.progressFailure, true); break;
                default: render(CanceledGlyph, options.theme.progressCanceled, true); break;
            }
        }

        wake.notify_all();
        if (ticker.joinable() && ticker.get_id() != std::this_thread::get_id())
            ticker.join();
    }
};

auto formatElapsed(std::chrono::milliseconds elapsed) -> std::string
{
    if (elapsed.count() < 100)
        return std::format("({}ms)", elapsed.count());
    return std::format("({:.1f}s)", static_cast<double>(elapsed.count()) / 1000.0);
}

Progress::Progress(io::OutputStream& stream, std::string message, ProgressOptions options):
    _impl(std::make_unique<Impl>(stream, std::move(message), std::move(options)))
{
    _impl->start();
}

Progress::~Progress()
{
    if (_impl)
        _impl->finish(ProgressState::Canceled, std::nullopt);
}

Progress::Progress(Progress&& other) noexcept = default;

auto Progress::operator=(Progress&& other) noexcept -> Progress&
{
    if (this != &other)
    {
        if (_impl)
            _impl->finish(ProgressState::Canceled, std::nullopt);
        _impl = std::move(other._impl);
    }
    return *this;
}

void Progress::update(std::string message)
{
    if (!_impl)
        return;

    auto const lock = std::lock_guard(_impl->mutex);
    if (_impl->state != ProgressState::Running)
        return;
    _impl->message = std::move(message);
    _impl->render(_impl->spinner.currentFrame(), _impl->options.theme.spinner, false);
}

void Progress::complete(std::optional<std::string> message)
{
    if (_impl)
        _impl->finish(ProgressState::Succeeded, std::move(message));
}

void Progress::fail(std::optional<std::string> message)
{
    if (_impl)
        _impl->finish(ProgressState::Failed, std::move(message));
}

void Progress::cancel()
{
    if (_impl)
        _impl->finish(ProgressState::Canceled, std::nullopt);
}

auto Progress::state() const -> ProgressState
{
    if (!_impl)
        return ProgressState::Idle;
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->state;
}

auto Progress::message() const -> std::string
{
    if (!_impl)
        return {};
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->message;
}

auto Progress::elapsed() const -> std::chrono::milliseconds
{
    if (!_impl)
        return std::chrono::milliseconds { 0 };
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->elapsedLocked();
}

} // namespace chisel::tui
