#include "options.hpp"

#include "../core/errors.hpp"

namespace cmdbench
{

namespace
{

void checkCount(const std::vector<std::string>& cmds, const char* what,
                std::size_t commandCount)
{
    if (cmds.empty() || cmds.size() == 1 || cmds.size() == commandCount)
        return;
    throw ConfigError("The " + std::string(what) +
                      " command count mismatch: got " +
                      std::to_string(cmds.size()) + " " + what +
                      " commands for " + std::to_string(commandCount) +
                      " benchmarked commands (expected 1 or " +
                      std::to_string(commandCount) + ")");
}

} // namespace

OutputStyle parseOutputStyle(const std::string& text)
{
    if (text == "full")
        return OutputStyle::Full;
    if (text == "basic")
        return OutputStyle::Basic;
    if (text == "none")
        return OutputStyle::None;
    throw ConfigError("Unknown output style '" + text +
                      "' (expected 'full', 'basic' or 'none')");
}

SortOrder parseSortOrder(const std::string& text)
{
    if (text == "command")
        return SortOrder::Command;
    if (text == "mean-time")
        return SortOrder::MeanTime;
    throw ConfigError("Unknown sort order '" + text +
                      "' (expected 'command' or 'mean-time')");
}

void validateOptions(const Options& opts)
{
    if (opts.commands.empty())
        throw ConfigError("No command to benchmark was given");
    if (opts.runs.min == 0)
        throw ConfigError("The minimum number of runs must be at least 1");
    if (opts.runs.max && *opts.runs.max < opts.runs.min)
        throw ConfigError("The maximum number of runs (" +
                          std::to_string(*opts.runs.max) +
                          ") is smaller than the minimum number of runs (" +
                          std::to_string(opts.runs.min) + ")");
    if (!(opts.minBenchmarkingTime > 0.0))
        throw ConfigError("The minimum benchmarking time must be positive");
    if (opts.commandNames.size() > opts.commands.size())
        throw ConfigError("Too many command names: " +
                          std::to_string(opts.commandNames.size()) +
                          " names for " +
                          std::to_string(opts.commands.size()) + " commands");
}

void validateCommandCount(const Options& opts, std::size_t commandCount)
{
    checkCount(opts.preparationCommands, "preparation", commandCount);
    checkCount(opts.cleanupCommands, "cleanup", commandCount);
}

std::optional<std::string> pickIntermediate(
    const std::vector<std::string>& commands, std::size_t index)
{
    if (commands.empty())
        return std::nullopt;
    if (commands.size() == 1)
        return commands.front();
    return commands.at(index);
}

} // namespace cmdbench
