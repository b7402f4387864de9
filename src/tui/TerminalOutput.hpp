// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <io/Stdio.hpp>

#include <string>
#include <string_view>

#include <tui/Ansi.hpp>

namespace chisel::tui
{

/// @brief Composes one frame of styled text and cursor control for an output stream.
///
/// Buffers everything internally and hands the whole frame to the stream in a
/// single write on flush(), so a frame is never interleaved with output from
/// another writer of the same stream.
class TerminalOutput
{
  public:
    /// @param stream The stream frames are written to.
    /// @param styled Whether write() applies styles. When false, text is written plain.
    explicit TerminalOutput(io::OutputStream& stream, bool styled = true);

    ~TerminalOutput();

    TerminalOutput(TerminalOutput const&) = delete;
    auto operator=(TerminalOutput const&) -> TerminalOutput& = delete;
    TerminalOutput(TerminalOutput&&) = delete;
    auto operator=(TerminalOutput&&) -> TerminalOutput& = delete;

    /// @brief Writes styled text at the current cursor position.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes raw text without styling.
    void writeRaw(std::string_view text);

    /// @brief Writes styled text followed by a line feed.
    void writeLine(std::string_view text = {}, Style const& style = {});

    /// @brief Returns @p text wrapped in @p style, or unchanged if styling is off.
    [[nodiscard]] auto styled(std::string_view text, Style const& style) const -> std::string;

    /// @brief Moves the cursor up by n rows.
    void moveUp(int n = 1);

    /// @brief Moves the cursor to the first column of the current row.
    void carriageReturn();

    /// @brief Clears the entire current line.
    void clearLine();

    /// @brief Clears from the cursor to the end of the screen.
    void clearToEndOfScreen();

    /// @brief Erases the current row and the @p rows - 1 rows above it.
    ///
    /// Leaves the cursor in the first column of the topmost erased row, which is
    /// where the erased content started. Rows above are never touched.
    void eraseRows(int rows);

    /// @brief Shows the cursor (CSI ?25h).
    void showCursor();

    /// @brief Hides the cursor (CSI ?25l).
    void hideCursor();

    /// @brief Saves the cursor position (ESC 7).
    void saveCursor();

    /// @brief Restores the cursor position (ESC 8).
    void restoreCursor();

    /// @brief Writes the buffered frame to the stream and flushes it.
    void flush();

    /// @brief Returns the stream's width in columns.
    [[nodiscard]] auto columns() const -> int;

    /// @brief Returns true if write() applies styles.
    [[nodiscard]] auto styling() const noexcept -> bool;

  private:
    io::OutputStream& _stream;
    std::string _buffer; ///< Output buffer for batching writes.
    bool _styled;
};

/// @brief Counts the line feeds in @p text.
[[nodiscard]] auto lineBreaks(std::string_view text) -> int;

/// @brief Returns the number of terminal rows @p text occupies when written from column 1.
///
/// Accounts for embedded line feeds and for soft wraps at @p columns. Escape
/// sequences do not count. A trailing line feed counts the row the cursor ends
/// up on, so rowsSpanned("abc\n", 80) is 2.
[[nodiscard]] auto rowsSpanned(std::string_view text, int columns) -> int;

} // namespace chisel::tui
