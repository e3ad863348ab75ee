#include "runner.hpp"

#include "../core/errors.hpp"
#include "../core/numeric.hpp"
#include "../core/statistics.hpp"
#include "../core/units.hpp"

#include <algorithm>

namespace cmdbench::bench
{

namespace
{

const char* const kPrepareAdvice =
    "The preparation command terminated with a non-zero exit code. Append "
    "' || true' to the command if you are sure that this can be ignored.";

const char* const kCleanupAdvice =
    "The cleanup command terminated with a non-zero exit code. Append "
    "' || true' to the command if you are sure that this can be ignored.";

// Clears the progress line when a run ends, including on errors.
struct ProgressGuard
{
    ProgressSink& sink;

    ~ProgressGuard()
    {
        sink.finish();
    }
};

} // namespace

const char* phaseName(Phase p)
{
    switch (p)
    {
        case Phase::Preparing:
            return "preparing";
        case Phase::Warmup:
            return "warmup";
        case Phase::Calibrating:
            return "calibrating";
        case Phase::Sampling:
            return "sampling";
        case Phase::Cleanup:
            return "cleanup";
        case Phase::Done:
            return "done";
    }
    return "unknown";
}

std::uint64_t plannedRunCount(Second minTime, const RunBounds& runs,
                              Second perIterationEstimate)
{
    if (!(perIterationEstimate > 0.0))
        return runs.max.value_or(runs.min);

    const std::uint64_t inMinTime =
        numeric::floorToCount(minTime / perIterationEstimate);
    std::uint64_t count = std::max(runs.min, inMinTime);
    if (runs.max)
        count = std::min(count, *runs.max);
    return count;
}

BenchmarkResult summarize(const std::string& name,
                          const std::vector<TimingResult>& samples,
                          const std::vector<std::optional<int>>& exitCodes,
                          const params::Bindings& parameters)
{
    std::vector<Second> real, user, system;
    real.reserve(samples.size());
    user.reserve(samples.size());
    system.reserve(samples.size());
    for (const auto& s : samples)
    {
        real.push_back(s.real);
        user.push_back(s.user);
        system.push_back(s.system);
    }

    BenchmarkResult r;
    r.command = name;
    r.mean = stats::calculateMean(real);
    r.stddev = stats::calculateStdDev(real, r.mean);
    r.median = stats::calculateMedian(real);
    r.user = stats::calculateMean(user);
    r.system = stats::calculateMean(system);
    r.min = stats::minimum(real);
    r.max = stats::maximum(real);
    r.times = std::move(real);
    r.exitCodes = exitCodes;
    r.parameters = params::renderBindings(parameters);
    return r;
}

BenchmarkRunner::BenchmarkRunner(const Options& options,
                                 const shell::ShellSpawningOverhead& spawning,
                                 shell::Executor& exec, ProgressSink& sink) :
    opts(options), overhead(spawning), executor(exec), progress(sink)
{}

TimingResult BenchmarkRunner::prepare(const std::optional<std::string>& cmd)
{
    if (!cmd)
        return TimingResult{};

    try
    {
        const auto r =
            executor.run(*cmd, opts.showOutput, FailureAction::RaiseError);
        return overhead.correct(r.timing);
    }
    catch (const CommandFailedError&)
    {
        throw PreparationError(kPrepareAdvice);
    }
}

TimingResult BenchmarkRunner::measure(const std::string& shellText,
                                      std::vector<TimingResult>& samples,
                                      std::vector<std::optional<int>>& exitCodes)
{
    const auto r = executor.run(shellText, opts.showOutput, opts.failureAction);
    const TimingResult corrected = overhead.correct(r.timing);
    samples.push_back(corrected);
    exitCodes.push_back(r.exitCode);
    return corrected;
}

BenchmarkOutcome BenchmarkRunner::run(std::size_t index,
                                      const params::Command& cmd)
{
    ProgressGuard guard{progress};

    current = Phase::Preparing;
    std::optional<std::string> prepareCmd =
        pickIntermediate(opts.preparationCommands, index);
    if (prepareCmd)
        prepareCmd = params::substitute(*prepareCmd, cmd.parameters);
    std::optional<std::string> cleanupCmd =
        pickIntermediate(opts.cleanupCommands, index);
    if (cleanupCmd)
        cleanupCmd = params::substitute(*cleanupCmd, cmd.parameters);

    current = Phase::Warmup;
    if (opts.warmupCount > 0)
    {
        progress.start(opts.warmupCount, "Performing warmup runs");
        for (std::uint64_t i = 0; i < opts.warmupCount; ++i)
        {
            prepare(prepareCmd);
            executor.run(cmd.shellText, opts.showOutput, opts.failureAction);
            progress.increment();
        }
        progress.finish();
    }

    current = Phase::Calibrating;
    progress.start(opts.runs.min, "Initial time measurement");

    std::vector<TimingResult> samples;
    std::vector<std::optional<int>> exitCodes;

    const TimingResult prepTime = prepare(prepareCmd);
    const TimingResult first = measure(cmd.shellText, samples, exitCodes);

    const Second estimate =
        first.real + prepTime.real + overhead.timing().real;
    const std::uint64_t count =
        plannedRunCount(opts.minBenchmarkingTime, opts.runs, estimate);

    progress.setLength(count);
    progress.increment();

    current = Phase::Sampling;
    std::vector<Second> real{first.real};
    for (std::uint64_t i = 1; i < count; ++i)
    {
        prepare(prepareCmd);

        progress.setMessage(
            "Current estimate: " +
            units::formatDuration(stats::calculateMean(real), opts.timeUnit)
                .first);

        real.push_back(measure(cmd.shellText, samples, exitCodes).real);
        progress.increment();
    }
    progress.finish();

    BenchmarkOutcome out;
    out.result = summarize(cmd.name, samples, exitCodes, cmd.parameters);
    out.warnings = collectWarnings(*out.result.times, out.result.exitCodes);

    current = Phase::Cleanup;
    if (cleanupCmd)
    {
        try
        {
            executor.run(*cleanupCmd, opts.showOutput,
                         FailureAction::RaiseError);
        }
        catch (const CommandFailedError&)
        {
            out.cleanupFailure = kCleanupAdvice;
        }
    }

    current = Phase::Done;
    return out;
}

} // namespace cmdbench::bench
