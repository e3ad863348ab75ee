#include "spawning_overhead.hpp"

#include "../benchmark/progress.hpp"
#include "../core/errors.hpp"
#include "../core/statistics.hpp"

#include <vector>

namespace cmdbench::shell
{

Second subtractOverhead(Second raw, Second overhead)
{
    return raw < overhead ? 0.0 : raw - overhead;
}

TimingResult ShellSpawningOverhead::correct(const TimingResult& raw) const
{
    return TimingResult{subtractOverhead(raw.real, overhead.real),
                        subtractOverhead(raw.user, overhead.user),
                        subtractOverhead(raw.system, overhead.system)};
}

ShellSpawningOverhead calibrate(Executor& executor, bool showOutput,
                                bench::ProgressSink& progress)
{
    std::vector<TimingResult> runs;
    runs.reserve(kCalibrationRuns);

    progress.start(kCalibrationRuns, "Measuring shell spawning time");
    for (std::uint64_t i = 0; i < kCalibrationRuns; ++i)
    {
        try
        {
            runs.push_back(
                executor.run("", showOutput, FailureAction::RaiseError).timing);
        }
        catch (const Error& e)
        {
            progress.finish();
            throw CalibrationError(
                "Could not measure shell execution time. Make sure you can "
                "run '" +
                executor.describe("") + "'. (" + e.what() + ")");
        }
        progress.increment();
    }
    progress.finish();

    return ShellSpawningOverhead(stats::meanTiming(runs));
}

} // namespace cmdbench::shell
