// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <chisel/Logger.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chisel
{

/// @brief Progress indicator configuration section.
struct ProgressConfig
{
    /// @brief Milliseconds between redraws. Zero selects the spinner's own interval.
    int intervalMs = 0;

    /// @brief One of "dots", "line", "circle", "arc", "bounce".
    std::string spinner = "dots";
};

/// @brief Prompt configuration section.
struct PromptConfig
{
    /// @brief Shown in place of a hidden answer.
    std::string mask = "******";
};

/// @brief Top-level configuration.
struct ChiselConfig
{
    ColorMode color = ColorMode::Always;
    log::Level logLevel = log::Level::Info;

    /// @brief Base theme, "default" or "mono".
    std::string theme = "default";

    /// @brief Style overrides as (role, style spec) pairs, applied on top of the base theme.
    std::vector<std::pair<std::string, std::string>> styles;

    ProgressConfig progress;
    PromptConfig prompt;
};

/// @brief Loads the configuration from the default config path.
///
/// A missing file is not an error; the defaults are returned.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<ChiselConfig>;

/// @brief Loads the configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration, or ConfigError for unreadable or invalid files.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<ChiselConfig>;

/// @brief Parses the configuration from JSON text.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<ChiselConfig>;

/// @brief Saves the configuration to a file, creating its directory if needed.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const ChiselConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Builds Logger options from a configuration.
///
/// Style overrides naming an unknown role are skipped with a warning.
[[nodiscard]] auto applyConfig(const ChiselConfig& config) -> LoggerOptions;

} // namespace chisel
