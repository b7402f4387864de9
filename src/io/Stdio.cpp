// SPDX-License-Identifier: Apache-2.0
#include <unistd.h>

#include <io/Stdio.hpp>
#include <io/TerminalStreams.hpp>

namespace chisel::io
{

namespace
{
    // Innermost override scope of the current thread.
    thread_local ScopedOverrides* gInnermost = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
} // namespace

auto standardOutput() -> OutputStream&
{
    static auto stream = FdOutputStream(STDOUT_FILENO);
    return stream;
}

auto standardInput() -> InputStream&
{
    static auto stream = FdInputStream(STDIN_FILENO);
    return stream;
}

// --- StdioOverrides ---

StdioOverrides::StdioOverrides():
    _output([]() -> OutputStream& { return standardOutput(); }),
    _input([]() -> InputStream& { return standardInput(); })
{
}

StdioOverrides::StdioOverrides(OutputProvider output, InputProvider input, StdioOverrides const& parent):
    _output(output ? std::move(output) : parent._output), _input(input ? std::move(input) : parent._input)
{
}

auto StdioOverrides::current() -> StdioOverrides
{
    if (gInnermost != nullptr)
        return gInnermost->_overrides;
    return StdioOverrides {};
}

auto StdioOverrides::active() noexcept -> bool
{
    return gInnermost != nullptr;
}

auto StdioOverrides::output() const -> OutputStream&
{
    return _output();
}

auto StdioOverrides::input() const -> InputStream&
{
    return _input();
}

// --- ScopedOverrides ---

ScopedOverrides::ScopedOverrides(OutputProvider output, InputProvider input):
    _overrides(std::move(output), std::move(input), StdioOverrides::current()), _parent(gInnermost)
{
    gInnermost = this;
}

ScopedOverrides::~ScopedOverrides()
{
    gInnermost = _parent;
}

auto resolveOutput() -> OutputStream&
{
    return StdioOverrides::current().output();
}

auto resolveInput() -> InputStream&
{
    return StdioOverrides::current().input();
}

} // namespace chisel::io
