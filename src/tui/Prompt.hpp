// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <io/Stdio.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <tui/Theme.hpp>

namespace chisel::tui
{

/// @brief Appearance of interactive prompts.
struct PromptOptions
{
    Theme theme = defaultTheme();
    bool styled = true;

    /// @brief Shown in place of a hidden answer once the prompt completed.
    std::string mask = "******";
};

/// @brief Interprets a yes/no answer, case-insensitively.
/// @return true for y, yes, yea, yeah, yep, yup; false for n, no, nope; std::nullopt otherwise.
[[nodiscard]] auto parseAnswer(std::string_view answer) -> std::optional<bool>;

/// @brief Strips leading and trailing whitespace.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/// @brief Interactive questions on an input/output stream pair.
///
/// Every prompt is rewritten in place once answered: the rows of the prompt
/// (including what the terminal echoed) are erased and replaced by the prompt
/// followed by the accepted answer. End of input counts as accepting the
/// default. Terminal modes and cursor visibility are restored on every exit
/// path.
class Prompt
{
  public:
    Prompt(io::OutputStream& output, io::InputStream& input, PromptOptions options = {});

    /// @brief Asks for a line of text.
    /// @param message The question.
    /// @param defaultValue Returned for empty input; shown as a dim "(value)" hint.
    /// @param hidden Read without echo and show a mask instead of the answer.
    ///               Falls back to a plain line read if the input is not a terminal.
    /// @return The trimmed answer, the default, or an empty string.
    [[nodiscard]] auto text(std::string_view message,
                            std::optional<std::string> defaultValue = std::nullopt,
                            bool hidden = false) -> std::string;

    /// @brief Asks a yes/no question. Unrecognized or empty answers yield @p defaultValue.
    [[nodiscard]] auto confirm(std::string_view message, bool defaultValue = false) -> bool;

    /// @brief Lets the user pick one of @p choices with the arrow keys.
    /// @param message The question.
    /// @param choices The options; must not be empty.
    /// @param defaultValue Initially selected choice; the first one if absent or not found.
    /// @return The chosen value, InvalidArgument for an empty list, or
    ///         NotInteractive if raw mode is unavailable.
    [[nodiscard]] auto chooseOne(std::string_view message,
                                 std::span<std::string const> choices,
                                 std::optional<std::string> defaultValue = std::nullopt) -> Result<std::string>;

  private:
    /// @brief Outcome of reading an answer line.
    struct Answer
    {
        std::optional<std::string> line; ///< std::nullopt at end of input.
        bool echoed = false;             ///< Whether the terminal displayed the line and its line feed.
    };

    io::OutputStream& _output;
    io::InputStream& _input;
    PromptOptions _options;

    [[nodiscard]] auto readAnswer() -> Answer;
    [[nodiscard]] auto readHiddenAnswer() -> Answer;

    /// @brief Replaces the prompt rows by @p promptLine followed by @p shown.
    void finish(std::string_view promptLine, Answer const& answer, std::string_view shown);
};

} // namespace chisel::tui
