#include "report.hpp"

#include "relative_speed.hpp"

#include <cstdio>
#include <iomanip>

namespace cmdbench::bench
{

void printHeader(std::ostream& os, std::size_t index, const std::string& name)
{
    os << "Benchmark " << (index + 1) << ": " << name << "\n";
}

void printResult(std::ostream& os, const BenchmarkResult& r,
                 std::optional<units::TimeUnit> unit)
{
    const auto [meanStr, u] = units::formatDuration(r.mean, unit);
    const std::string stddevStr =
        units::formatDuration(r.stddev.value_or(0.0), u).first;
    const std::string userStr = units::formatDuration(r.user, u).first;
    const std::string systemStr = units::formatDuration(r.system, u).first;
    const std::string minStr = units::formatDuration(r.min, u).first;
    const std::string maxStr = units::formatDuration(r.max, u).first;
    const std::size_t runs = r.exitCodes.size();

    os << "  Time (mean ± σ):     " << std::setw(10) << meanStr << " ± "
       << std::setw(10) << stddevStr << "    [User: " << userStr
       << ", System: " << systemStr << "]\n";
    os << "  Range (min … max):   " << std::setw(10) << minStr << " … "
       << std::setw(10) << maxStr << "    " << runs
       << (runs == 1 ? " run" : " runs") << "\n";
}

void printWarnings(std::ostream& os, const std::vector<Warning>& warnings,
                   std::optional<units::TimeUnit> unit)
{
    if (warnings.empty())
        return;

    os << " \n";
    for (const auto& w : warnings)
        os << "  Warning: " << describe(w, unit) << "\n";
}

void printSummary(std::ostream& os, const std::vector<BenchmarkResult>& results,
                  SortOrder order)
{
    if (results.size() < 2)
        return;

    const auto annotated = relspeed::computeWithCheck(results, order);
    if (!annotated)
    {
        os << "  Warning: No relative speed comparison is possible because "
              "the fastest command has a mean time of zero.\n";
        return;
    }

    const relspeed::ResultWithRelativeSpeed* fastest = nullptr;
    for (const auto& entry : *annotated)
    {
        if (entry.isFastest)
            fastest = &entry;
    }
    if (fastest == nullptr)
        return;

    os << "Summary\n";
    os << "  '" << fastest->result->command << "' ran\n";
    for (const auto& entry : *annotated)
    {
        if (entry.isFastest)
            continue;

        char buf[96];
        if (entry.relativeSpeedStddev)
            std::snprintf(buf, sizeof(buf), "%.2f ± %.2f", entry.relativeSpeed,
                          *entry.relativeSpeedStddev);
        else
            std::snprintf(buf, sizeof(buf), "%.2f", entry.relativeSpeed);
        os << "    " << buf << " times faster than '" << entry.result->command
           << "'\n";
    }
}

} // namespace cmdbench::bench
