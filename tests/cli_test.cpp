#include "core/errors.hpp"
#include "options/cli.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace cmdbench;

namespace
{

Options parse(const std::vector<std::string>& args)
{
    return cli::parseArguments(args).options;
}

} // namespace

TEST(CliTest, Defaults)
{
    const Options o = parse({"sleep 0.1"});
    ASSERT_EQ(o.commands.size(), 1u);
    EXPECT_EQ(o.commands[0], "sleep 0.1");
    EXPECT_EQ(o.runs.min, 10u);
    EXPECT_FALSE(o.runs.max.has_value());
    EXPECT_DOUBLE_EQ(o.minBenchmarkingTime, 3.0);
    EXPECT_EQ(o.warmupCount, 0u);
    EXPECT_EQ(o.failureAction, FailureAction::RaiseError);
    EXPECT_EQ(o.shell, "sh");
    EXPECT_EQ(o.outputStyle, OutputStyle::Full);
    EXPECT_EQ(o.sortOrder, SortOrder::Command);
    EXPECT_FALSE(o.timeUnit.has_value());
    EXPECT_TRUE(o.exports.includeTimes);
}

TEST(CliTest, RunBoundsAndWarmup)
{
    const Options o = parse({"-w", "3", "--min-runs=5", "-M", "8", "ls"});
    EXPECT_EQ(o.warmupCount, 3u);
    EXPECT_EQ(o.runs.min, 5u);
    EXPECT_EQ(o.runs.max, 8u);

    const Options exact = parse({"--runs", "4", "ls"});
    EXPECT_EQ(exact.runs.min, 4u);
    EXPECT_EQ(exact.runs.max, 4u);
}

TEST(CliTest, RepeatedCommandsAndIntermediates)
{
    const Options o =
        parse({"-p", "sync", "--prepare=echo {x}", "-c", "rm -f out", "a",
               "-n", "first", "b", "--ignore-failure", "--show-output"});
    EXPECT_EQ(o.commands, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(o.preparationCommands,
              (std::vector<std::string>{"sync", "echo {x}"}));
    EXPECT_EQ(o.cleanupCommands, (std::vector<std::string>{"rm -f out"}));
    EXPECT_EQ(o.commandNames, (std::vector<std::string>{"first"}));
    EXPECT_EQ(o.failureAction, FailureAction::Ignore);
    EXPECT_TRUE(o.showOutput);
}

TEST(CliTest, ParameterScanWithStepAppliesToEveryScan)
{
    const Options o = parse({"-P", "x", "1", "2", "-D", "0.5", "-P", "y", "0",
                             "1", "echo {x} {y}"});
    ASSERT_EQ(o.parameters.size(), 2u);
    for (const auto& axis : o.parameters)
    {
        const auto& scan = std::get<params::ParameterScan>(axis);
        ASSERT_TRUE(scan.step.has_value());
        EXPECT_EQ(params::toString(*scan.step), "0.5");
    }
    EXPECT_EQ(params::axisValues(o.parameters[0]).size(), 3u);
}

TEST(CliTest, ParameterList)
{
    const Options o = parse({"-L", "compiler", "gcc,clang", "{compiler} -v"});
    ASSERT_EQ(o.parameters.size(), 1u);
    const auto& list = std::get<params::ParameterList>(o.parameters[0]);
    EXPECT_EQ(list.name, "compiler");
    ASSERT_EQ(list.values.size(), 2u);
    EXPECT_EQ(params::toString(list.values[1]), "clang");
}

TEST(CliTest, StyleUnitSortAndExports)
{
    const Options o = parse(
        {"-s", "basic", "-u", "millisecond", "--sort", "mean-time",
         "--export-json", "r.json", "--export-csv=r.csv",
         "--export-markdown", "r.md", "--export-omit-times", "--log-file",
         "run.log", "-S", "bash --norc", "ls"});
    EXPECT_EQ(o.outputStyle, OutputStyle::Basic);
    EXPECT_EQ(o.timeUnit, units::TimeUnit::MilliSecond);
    EXPECT_EQ(o.sortOrder, SortOrder::MeanTime);
    EXPECT_EQ(o.exports.jsonPath, "r.json");
    EXPECT_EQ(o.exports.csvPath, "r.csv");
    EXPECT_EQ(o.exports.markdownPath, "r.md");
    EXPECT_FALSE(o.exports.includeTimes);
    EXPECT_EQ(o.logPath, "run.log");
    EXPECT_EQ(o.shell, "bash --norc");
}

TEST(CliTest, DoubleDashEndsOptions)
{
    const Options o = parse({"-w", "1", "--", "-not-an-option", "ls"});
    EXPECT_EQ(o.commands,
              (std::vector<std::string>{"-not-an-option", "ls"}));
}

TEST(CliTest, HelpAndVersion)
{
    EXPECT_TRUE(cli::parseArguments({"--help"}).showHelp);
    EXPECT_TRUE(cli::parseArguments({"-V"}).showVersion);
    EXPECT_NE(cli::usage().find("--parameter-scan"), std::string::npos);
}

TEST(CliTest, Errors)
{
    EXPECT_THROW(parse({"--bogus", "ls"}), ConfigError);
    EXPECT_THROW(parse({"ls", "--warmup"}), ConfigError);
    EXPECT_THROW(parse({"-m", "ten", "ls"}), ConfigError);
    EXPECT_THROW(parse({"-m", "-1", "ls"}), ConfigError);
    EXPECT_THROW(parse({"--min-benchmarking-time", "x", "ls"}), ConfigError);
    EXPECT_THROW(parse({"-s", "fancy", "ls"}), ConfigError);
    EXPECT_THROW(parse({"-u", "minute", "ls"}), ConfigError);
    EXPECT_THROW(parse({"--sort", "name", "ls"}), ConfigError);
    EXPECT_THROW(parse({"-D", "2", "ls"}), ConfigError);
    EXPECT_THROW(parse({"-P", "x", "1"}), ConfigError);
}

TEST(CliTest, CommandLineOverridesConfigFile)
{
    const auto path =
        std::filesystem::temp_directory_path() / "cmdbench_cli_config.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"commands": ["from-config"], "warmup": 2, "minRuns": 20,
                   "prepare": "prep-config", "style": "none"})";
    }

    const Options o = parse({"--config", path.string(), "-m", "3", "-p",
                             "prep-cli", "from-cli"});
    EXPECT_EQ(o.commands,
              (std::vector<std::string>{"from-config", "from-cli"}));
    EXPECT_EQ(o.warmupCount, 2u);
    EXPECT_EQ(o.runs.min, 3u);
    EXPECT_EQ(o.preparationCommands,
              (std::vector<std::string>{"prep-cli"}));
    EXPECT_EQ(o.outputStyle, OutputStyle::None);

    std::filesystem::remove(path);
}

TEST(CliTest, MissingConfigFile)
{
    EXPECT_THROW(parse({"--config=/nonexistent/cmdbench.json", "ls"}),
                 ConfigError);
}
