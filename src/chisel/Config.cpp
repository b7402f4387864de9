// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

#include <tui/Ansi.hpp>
#include <tui/Spinner.hpp>
#include <tui/Theme.hpp>

namespace chisel
{

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/chisel";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/chisel";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/chisel";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<ChiselConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = ChiselConfig {};

    auto const color = json::getStringOr(root, "color", "always");
    if (auto const mode = parseColorMode(color))
        config.color = *mode;
    else
        return makeError(ErrorCode::ConfigError, std::format("Invalid color mode '{}'", color));

    auto const level = json::getStringOr(root, "logLevel", "info");
    if (auto const parsed = log::parseLevel(level))
        config.logLevel = *parsed;
    else
        return makeError(ErrorCode::ConfigError, std::format("Invalid log level '{}'", level));

    config.theme = json::getStringOr(root, "theme", "default");
    if (config.theme != "default" && config.theme != "mono")
        return makeError(ErrorCode::ConfigError, std::format("Unknown theme '{}'", config.theme));

    config.styles = json::getStringMap(root, "styles");

    // Progress section
    if (root.contains("progress"))
    {
        auto const& progress = root["progress"];
        config.progress.intervalMs = json::getIntOr(progress, "intervalMs", 0);
        config.progress.spinner = json::getStringOr(progress, "spinner", "dots");
        if (config.progress.intervalMs < 0)
            return makeError(ErrorCode::ConfigError, "progress.intervalMs must not be negative");
        if (!tui::parseSpinnerType(config.progress.spinner))
            return makeError(ErrorCode::ConfigError, std::format("Unknown spinner '{}'", config.progress.spinner));
    }

    // Prompt section
    if (root.contains("prompt"))
        config.prompt.mask = json::getStringOr(root["prompt"], "mask", "******");

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<ChiselConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(config.error().code, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const ChiselConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["color"] = std::string(colorModeName(config.color));
    root["logLevel"] = std::string(log::levelName(config.logLevel));
    root["theme"] = config.theme;

    if (!config.styles.empty())
    {
        auto styles = nlohmann::json::object();
        for (const auto& [role, spec]: config.styles)
            styles[role] = spec;
        root["styles"] = std::move(styles);
    }

    auto progress = nlohmann::json::object();
    progress["intervalMs"] = config.progress.intervalMs;
    progress["spinner"] = config.progress.spinner;
    root["progress"] = std::move(progress);

    auto prompt = nlohmann::json::object();
    prompt["mask"] = config.prompt.mask;
    root["prompt"] = std::move(prompt);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<ChiselConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return ChiselConfig {};
    }
    return loadConfigFromFile(path);
}

auto applyConfig(const ChiselConfig& config) -> LoggerOptions
{
    auto options = LoggerOptions {};
    options.theme = tui::themeByName(config.theme);
    for (auto const& [role, spec]: config.styles)
    {
        if (!tui::setThemeStyle(options.theme, role, tui::parseStyle(spec)))
            log::warning("Ignoring style for unknown role '{}'", role);
    }

    options.colorMode = config.color;
    options.spinner = tui::parseSpinnerType(config.progress.spinner).value_or(tui::SpinnerType::Dots);
    options.progressInterval = std::chrono::milliseconds { config.progress.intervalMs };
    options.mask = config.prompt.mask;
    return options;
}

} // namespace chisel
