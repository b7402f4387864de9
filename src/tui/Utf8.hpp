// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string_view>

namespace chisel::tui
{

/// @brief Returns the byte offset at which the last grapheme cluster of @p text starts.
///
/// Returns 0 for empty text. Removing text.substr(offset) deletes exactly one
/// user-perceived character, which is what a backspace should do.
[[nodiscard]] auto lastGraphemeClusterStart(std::string_view text) -> std::size_t;

/// @brief Returns the number of cells @p text occupies, assuming one cell per grapheme cluster.
///
/// Escape sequences must have been stripped. East Asian wide characters are
/// counted as one cell.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

} // namespace chisel::tui
