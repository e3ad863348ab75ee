#include "warnings.hpp"

#include "outlier_detection.hpp"

#include <algorithm>

namespace cmdbench::bench
{

std::vector<Warning> collectWarnings(
    const std::vector<Second>& times,
    const std::vector<std::optional<int>>& exitCodes)
{
    std::vector<Warning> out;

    if (std::any_of(times.begin(), times.end(),
                    [](Second t) { return t < kMinExecutionTime; }))
    {
        out.push_back(Warning{WarningKind::FastExecutionTime});
    }

    if (std::any_of(exitCodes.begin(), exitCodes.end(),
                    [](const std::optional<int>& c) { return c != 0; }))
    {
        out.push_back(Warning{WarningKind::NonZeroExitCode});
    }

    const auto scores = outlier::modifiedZScores(times);
    switch (outlier::classify(scores))
    {
        case outlier::OutlierClass::SlowInitialRun:
            out.push_back(Warning{WarningKind::SlowInitialRun, times.front()});
            break;
        case outlier::OutlierClass::OutliersDetected:
            out.push_back(Warning{WarningKind::OutliersDetected});
            break;
        case outlier::OutlierClass::None:
            break;
    }

    return out;
}

std::string describe(const Warning& w, std::optional<units::TimeUnit> unit)
{
    switch (w.kind)
    {
        case WarningKind::FastExecutionTime:
            return "Command took less than 5 ms to complete. Results might "
                   "be inaccurate.";
        case WarningKind::NonZeroExitCode:
            return "Ignoring non-zero exit code.";
        case WarningKind::SlowInitialRun:
            return "The first benchmarking run for this command was "
                   "significantly slower than the rest (" +
                   units::formatDuration(w.firstRunTime, unit).first +
                   "). This could be caused by (filesystem) caches that were "
                   "not filled until after the first run. You should "
                   "consider using the '--warmup' option to fill those "
                   "caches before the actual benchmark. Alternatively, use "
                   "the '--prepare' option to clear the caches before each "
                   "timing run.";
        case WarningKind::OutliersDetected:
            return "Statistical outliers were detected. Consider re-running "
                   "this benchmark on a quiet system without any "
                   "interferences from other programs. It might help to use "
                   "the '--warmup' or '--prepare' options.";
    }
    return {};
}

} // namespace cmdbench::bench
