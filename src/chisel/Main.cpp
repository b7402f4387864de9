// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <chisel/Config.hpp>
#include <chisel/Logger.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <format>
#include <string>
#include <thread>
#include <vector>

namespace
{

// sysexits.h
constexpr auto ExitUsage = 64;
constexpr auto ExitSoftware = 70;

auto exitCodeFor(chisel::Error const& error) -> int
{
    switch (error.code)
    {
        case chisel::ErrorCode::InvalidArgument: return ExitUsage;
        default: return ExitSoftware;
    }
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "chisel-demo - styled output, progress and prompts on the terminal" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto colorMode = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--color", colorMode, "When to style output (always|auto|never)")
        ->check(CLI::IsMember({ "always", "auto", "never" }));
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto message = std::string {};
    auto defaultValue = std::string {};

    auto* promptCmd = app.add_subcommand("prompt", "Ask for a line of text");
    promptCmd->add_option("message", message, "The question")->required();
    promptCmd->add_option("-d,--default", defaultValue, "Default answer");

    auto* secretCmd = app.add_subcommand("secret", "Ask for hidden input");
    secretCmd->add_option("message", message, "The question")->required();

    auto defaultYes = false;
    auto* confirmCmd = app.add_subcommand("confirm", "Ask a yes/no question");
    confirmCmd->add_option("message", message, "The question")->required();
    confirmCmd->add_flag("-y,--default-yes", defaultYes, "Answer yes on empty input");

    auto choices = std::vector<std::string> {};
    auto* chooseCmd = app.add_subcommand("choose", "Pick one of several choices");
    chooseCmd->add_option("message", message, "The question")->required();
    chooseCmd->add_option("choices", choices, "The choices")->required();
    chooseCmd->add_option("-d,--default", defaultValue, "Initially selected choice");

    auto steps = 3;
    auto stepMs = 400;
    auto failAtEnd = false;
    auto* progressCmd = app.add_subcommand("progress", "Run a simulated task with a progress indicator");
    progressCmd->add_option("message", message, "Task description")->required();
    progressCmd->add_option("--steps", steps, "Number of steps")->check(CLI::PositiveNumber);
    progressCmd->add_option("--step-ms", stepMs, "Duration of each step")->check(CLI::NonNegativeNumber);
    progressCmd->add_flag("--fail", failAtEnd, "Finish with a failure");

    auto* messagesCmd = app.add_subcommand("messages", "Print every message style");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? chisel::loadConfig() : chisel::loadConfigFromFile(configPath);
    if (!configResult)
    {
        chisel::log::error("Failed to load config: {}", configResult.error());
        return ExitUsage;
    }

    auto& config = *configResult;
    if (!colorMode.empty())
        config.color = chisel::parseColorMode(colorMode).value_or(chisel::ColorMode::Always);
    if (verbose)
        config.logLevel = chisel::log::Level::Debug;

    chisel::log::setLevel(config.logLevel);

    auto logger = chisel::Logger(chisel::applyConfig(config));

    if (*promptCmd)
    {
        auto const answer = logger.prompt(message,
                                          { .defaultValue = defaultValue.empty() ? std::nullopt
                                                                                 : std::optional(defaultValue),
                                            .hidden = false });
        logger.detail(std::format("answer: {}", answer));
    }
    else if (*secretCmd)
    {
        auto const answer = logger.prompt(message, { .defaultValue = std::nullopt, .hidden = true });
        logger.detail(std::format("{} character(s) entered", answer.size()));
    }
    else if (*confirmCmd)
    {
        auto const answer = logger.confirm(message, defaultYes);
        logger.detail(std::format("answer: {}", answer ? "yes" : "no"));
    }
    else if (*chooseCmd)
    {
        auto const choice =
            logger.chooseOne(message, choices, defaultValue.empty() ? std::nullopt : std::optional(defaultValue));
        if (!choice)
        {
            logger.err(std::format("{}", choice.error()));
            return exitCodeFor(choice.error());
        }
        logger.detail(std::format("chosen: {}", *choice));
    }
    else if (*progressCmd)
    {
        auto progress = logger.progress(message);
        for (auto step = 1; step <= steps; ++step)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds { stepMs });
            progress.update(std::format("{} ({}/{})", message, step, steps));
        }
        if (failAtEnd)
            progress.fail(std::format("{} failed", message));
        else
            progress.complete(std::format("{} done", message));
    }
    else if (*messagesCmd)
    {
        logger.delayed("Delayed messages appear last.");
        logger.info("Info message.");
        logger.detail("Detail message.");
        logger.success("Success message.");
        logger.alert("Alert message.");
        logger.warn("Warning message.");
        logger.warn("Custom tag.", "NOTE");
        logger.err("Error message.");
        logger.flush();
    }

    return 0;
}
