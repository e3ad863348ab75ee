#pragma once

#include "options.hpp"

#include <string>
#include <vector>

namespace cmdbench::cli
{

constexpr const char* kProgramName = "cmdbench";
constexpr const char* kVersion = "1.0.0";

struct ParsedArguments
{
    Options options;
    bool showHelp{false};
    bool showVersion{false};
};

// Parse the arguments after the program name. A `--config FILE` anywhere on
// the line is loaded first; every other option then overrides it.
// Throws ConfigError on unknown options, missing values or bad numbers.
ParsedArguments parseArguments(const std::vector<std::string>& args);

ParsedArguments parseArguments(int argc, char** argv);

std::string usage();

} // namespace cmdbench::cli
