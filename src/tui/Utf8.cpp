// SPDX-License-Identifier: Apache-2.0
#include <libunicode/utf8_grapheme_segmenter.h>
#include <tui/Utf8.hpp>

namespace chisel::tui
{

auto lastGraphemeClusterStart(std::string_view text) -> std::size_t
{
    if (text.empty())
        return 0;

    // The iterator's _clusterStart points into the segmented string_view.
    auto segmenter = unicode::utf8_grapheme_segmenter(text);
    auto lastBoundaryOffset = std::size_t { 0 };
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        lastBoundaryOffset = static_cast<std::size_t>(it._clusterStart - text.data());

    return lastBoundaryOffset;
}

auto displayWidth(std::string_view text) -> int
{
    if (text.empty())
        return 0;

    auto width = 0;
    auto segmenter = unicode::utf8_grapheme_segmenter(text);
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        ++width;
    return width;
}

} // namespace chisel::tui
