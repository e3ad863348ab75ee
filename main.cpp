#include "benchmark/report.hpp"
#include "benchmark/runner.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/units.hpp"
#include "export/export_manager.hpp"
#include "options/cli.hpp"
#include "parameters/expander.hpp"
#include "shell/executor.hpp"
#include "shell/spawning_overhead.hpp"

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace cmdbench;

// Whether results (headers, timings, summary) go to stdout.
static bool showsResults(OutputStyle style)
{
    switch (style)
    {
        case OutputStyle::Full:
        case OutputStyle::Basic:
            return true;
        case OutputStyle::None:
            return false;
    }
    return false;
}

static std::string logSummary(const bench::BenchmarkResult& r)
{
    std::ostringstream oss;
    oss << "benchmark '" << r.command << "' mean=" << r.mean
        << " stddev=" << r.stddev.value_or(0.0) << " median=" << r.median
        << " min=" << r.min << " max=" << r.max
        << " runs=" << r.exitCodes.size();
    return oss.str();
}

// The whole pipeline: expand, calibrate, benchmark each command, summarize,
// export. Returns the process exit status.
static int runBenchmarks(const Options& opts)
{
    validateOptions(opts);

    const std::vector<params::Command> commands =
        params::expandCommands(opts.commands, opts.commandNames,
                               opts.parameters);
    validateCommandCount(opts, commands.size());

    const auto exports = exporter::ExportManager::fromTargets(opts.exports);

    shell::ShellExecutor executor(opts.shell);
    auto progress = bench::makeProgressSink(opts.outputStyle);
    const bool printing = showsResults(opts.outputStyle);

    const shell::ShellSpawningOverhead overhead =
        shell::calibrate(executor, opts.showOutput, *progress);
    {
        std::ostringstream oss;
        oss << "shell '" << opts.shell
            << "' spawning overhead real=" << overhead.timing().real
            << " user=" << overhead.timing().user
            << " system=" << overhead.timing().system;
        log::appendLine(opts.logPath, oss.str());
    }

    bench::BenchmarkRunner runner(opts, overhead, executor, *progress);
    std::vector<bench::BenchmarkResult> results;
    bool cleanupFailed = false;

    for (std::size_t i = 0; i < commands.size(); ++i)
    {
        if (printing)
            bench::printHeader(std::cout, i, commands[i].name);

        bench::BenchmarkOutcome outcome = runner.run(i, commands[i]);

        if (printing)
            bench::printResult(std::cout, outcome.result, opts.timeUnit);
        std::cout.flush();
        bench::printWarnings(std::cerr, outcome.warnings, opts.timeUnit);

        if (outcome.cleanupFailure)
        {
            cleanupFailed = true;
            std::cerr << "[cmdbench] Error: " << *outcome.cleanupFailure
                      << "\n";
            log::appendLine(opts.logPath,
                            "cleanup failed: " + *outcome.cleanupFailure);
        }
        if (printing)
            std::cout << "\n";

        log::appendLine(opts.logPath, logSummary(outcome.result));
        results.push_back(std::move(outcome.result));
    }

    if (printing)
        bench::printSummary(std::cout, results, opts.sortOrder);

    exports.writeResults(results, opts.timeUnit);

    return cleanupFailed ? 1 : 0;
}

int main(int argc, char** argv)
{
    cli::ParsedArguments parsed;
    try
    {
        parsed = cli::parseArguments(argc, argv);
    }
    catch (const Error& e)
    {
        std::cerr << "[cmdbench] Error: " << e.what() << "\n";
        std::cerr << "Run '" << cli::kProgramName
                  << " --help' for the list of options.\n";
        return 1;
    }

    if (parsed.showHelp)
    {
        std::cout << cli::usage();
        return 0;
    }
    if (parsed.showVersion)
    {
        std::cout << cli::kProgramName << " " << cli::kVersion << "\n";
        return 0;
    }

    const Options& opts = parsed.options;
    try
    {
        return runBenchmarks(opts);
    }
    catch (const Error& e)
    {
        std::cerr << "[cmdbench] Error: " << e.what() << "\n";
        log::appendLine(opts.logPath, std::string("error: ") + e.what());
    }
    catch (const std::exception& e)
    {
        std::cerr << "[cmdbench] Unexpected error: " << e.what() << "\n";
        log::appendLine(opts.logPath,
                        std::string("unexpected error: ") + e.what());
    }
    return 1;
}
