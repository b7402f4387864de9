// SPDX-License-Identifier: Apache-2.0
#include <tui/KeyWindow.hpp>

namespace chisel::tui
{

auto KeyWindow::feed(std::uint8_t byte) -> std::optional<Key>
{
    if (_size == Capacity)
        clear();
    _bytes[_size++] = static_cast<char>(byte);

    auto prefix = false;
    if (auto const key = match(prefix))
    {
        clear();
        return key;
    }
    if (prefix)
        return std::nullopt;

    // Dead end. Start over with this byte alone.
    clear();
    _bytes[_size++] = static_cast<char>(byte);
    if (auto const key = match(prefix))
    {
        clear();
        return key;
    }
    if (!prefix)
        clear();
    return std::nullopt;
}

auto KeyWindow::pending() const noexcept -> std::string_view
{
    return std::string_view(_bytes.data(), _size);
}

void KeyWindow::clear() noexcept
{
    _size = 0;
}

auto KeyWindow::match(bool& prefix) const -> std::optional<Key>
{
    auto const window = pending();
    prefix = false;
    for (auto const& sequence: keys::Sequences)
    {
        if (sequence.bytes == window)
            return sequence.key;
        if (sequence.bytes.size() > window.size() && sequence.bytes.starts_with(window))
            prefix = true;
    }
    return std::nullopt;
}

} // namespace chisel::tui
