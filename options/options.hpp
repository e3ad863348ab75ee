#pragma once

#include "../core/types.hpp"
#include "../core/units.hpp"
#include "../parameters/expander.hpp"
#include "../shell/executor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cmdbench
{

struct RunBounds
{
    std::uint64_t min{10};
    std::optional<std::uint64_t> max;
};

struct ExportTargets
{
    std::string csvPath;
    std::string jsonPath;
    std::string markdownPath;
    bool includeTimes{true}; // raw samples in the JSON export
};

struct Options
{
    std::vector<std::string> commands;     // command templates
    std::vector<std::string> commandNames; // display-name templates
    std::vector<params::ParameterAxis> parameters;

    std::uint64_t warmupCount{0};
    RunBounds runs;
    Second minBenchmarkingTime{3.0};
    FailureAction failureAction{FailureAction::RaiseError};

    // Either one shared command or one per expanded command.
    std::vector<std::string> preparationCommands;
    std::vector<std::string> cleanupCommands;

    std::string shell{shell::kDefaultShell};
    bool showOutput{false};
    OutputStyle outputStyle{OutputStyle::Full};
    std::optional<units::TimeUnit> timeUnit;
    SortOrder sortOrder{SortOrder::Command};

    ExportTargets exports;
    std::string logPath; // run log; empty disables it
};

// "full", "basic" or "none". Throws ConfigError.
OutputStyle parseOutputStyle(const std::string& text);

// "command" or "mean-time". Throws ConfigError.
SortOrder parseSortOrder(const std::string& text);

// Checks that do not depend on the expanded command list.
// Throws ConfigError.
void validateOptions(const Options& opts);

// Preparation/cleanup counts must be 1 or exactly `commandCount`.
void validateCommandCount(const Options& opts, std::size_t commandCount);

// The preparation/cleanup command for the command at `index`, if any.
std::optional<std::string> pickIntermediate(
    const std::vector<std::string>& commands, std::size_t index);

} // namespace cmdbench
