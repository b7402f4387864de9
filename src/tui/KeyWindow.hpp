// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chisel::tui
{

/// @brief Keys recognized while a choice list is active.
enum class Key : std::uint8_t
{
    Up,
    Down,
    Enter,
};

/// @brief Returns a printable name of @p key for diagnostics.
[[nodiscard]] constexpr auto keyName(Key key) noexcept -> std::string_view
{
    switch (key)
    {
        case Key::Up: return "Up";
        case Key::Down: return "Down";
        case Key::Enter: return "Enter";
    }
    return "?";
}

/// @brief A byte sequence a terminal sends for a key.
struct KeySequence
{
    std::string_view bytes;
    Key key;
};

namespace keys
{
    constexpr auto UpArrow = std::string_view { "\033[A" };
    constexpr auto DownArrow = std::string_view { "\033[B" };
    constexpr auto UpArrowApplicationMode = std::string_view { "\033OA" };
    constexpr auto DownArrowApplicationMode = std::string_view { "\033OB" };
    constexpr auto LineFeed = std::string_view { "\n" };
    constexpr auto CarriageReturn = std::string_view { "\r" };

    /// @brief All sequences the window recognizes.
    constexpr auto Sequences = std::array {
        KeySequence { UpArrow, Key::Up },
        KeySequence { DownArrow, Key::Down },
        KeySequence { UpArrowApplicationMode, Key::Up },
        KeySequence { DownArrowApplicationMode, Key::Down },
        KeySequence { LineFeed, Key::Enter },
        KeySequence { CarriageReturn, Key::Enter },
    };
} // namespace keys

/// @brief Sliding window over raw input bytes that recognizes key sequences.
///
/// Bytes are fed one at a time. When the window equals a known sequence the
/// key is reported and the window cleared. When the window can no longer grow
/// into any known sequence it is cleared; the offending byte is kept if it
/// starts a new sequence (e.g. an ESC right after an unrelated key).
class KeyWindow
{
  public:
    static constexpr auto Capacity = std::size_t { 3 };

    /// @brief Feeds one byte.
    /// @return The key completed by this byte, if any.
    [[nodiscard]] auto feed(std::uint8_t byte) -> std::optional<Key>;

    /// @brief Returns the bytes currently buffered.
    [[nodiscard]] auto pending() const noexcept -> std::string_view;

    /// @brief Discards the buffered bytes.
    void clear() noexcept;

  private:
    std::array<char, Capacity> _bytes {};
    std::size_t _size = 0;

    /// @brief Matches the buffer against the sequence table.
    /// @return The completed key, or nullopt. Sets @p prefix if the buffer may still complete a sequence.
    [[nodiscard]] auto match(bool& prefix) const -> std::optional<Key>;
};

} // namespace chisel::tui
