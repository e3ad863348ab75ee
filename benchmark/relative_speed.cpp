#include "relative_speed.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace cmdbench::relspeed
{

namespace
{

std::vector<ResultWithRelativeSpeed> computeRelativeSpeeds(
    const std::vector<bench::BenchmarkResult>& results, std::size_t fastest,
    SortOrder order)
{
    const auto& ref = results[fastest];

    std::vector<ResultWithRelativeSpeed> out;
    out.reserve(results.size());
    for (std::size_t i = 0; i < results.size(); ++i)
    {
        const auto& r = results[i];
        ResultWithRelativeSpeed entry;
        entry.result = &r;
        entry.isFastest = (i == fastest);

        if (ref.mean == 0.0)
        {
            entry.relativeSpeed = r.mean == 0.0
                                      ? 1.0
                                      : std::numeric_limits<double>::infinity();
            out.push_back(entry);
            continue;
        }

        const double ratio = r.mean / ref.mean;
        entry.relativeSpeed = ratio;

        // Propagation of uncertainty for a quotient; the two means are
        // assumed independent.
        if (r.stddev && ref.stddev && r.mean != 0.0)
        {
            entry.relativeSpeedStddev =
                ratio * std::sqrt(std::pow(*r.stddev / r.mean, 2) +
                                  std::pow(*ref.stddev / ref.mean, 2));
        }
        out.push_back(entry);
    }

    switch (order)
    {
        case SortOrder::Command:
            break;
        case SortOrder::MeanTime:
            std::stable_sort(out.begin(), out.end(),
                             [](const ResultWithRelativeSpeed& a,
                                const ResultWithRelativeSpeed& b) {
                                 return a.result->mean < b.result->mean;
                             });
            break;
    }
    return out;
}

} // namespace

std::size_t fastestIndex(const std::vector<bench::BenchmarkResult>& results)
{
    std::size_t best = 0;
    for (std::size_t i = 1; i < results.size(); ++i)
    {
        if (results[i].mean < results[best].mean)
            best = i;
    }
    return best;
}

std::optional<std::vector<ResultWithRelativeSpeed>> computeWithCheck(
    const std::vector<bench::BenchmarkResult>& results, SortOrder order)
{
    if (results.empty())
        return std::vector<ResultWithRelativeSpeed>{};

    const std::size_t fastest = fastestIndex(results);
    if (results[fastest].mean == 0.0)
        return std::nullopt;
    return computeRelativeSpeeds(results, fastest, order);
}

std::vector<ResultWithRelativeSpeed> compute(
    const std::vector<bench::BenchmarkResult>& results, SortOrder order)
{
    if (results.empty())
        return {};
    return computeRelativeSpeeds(results, fastestIndex(results), order);
}

} // namespace cmdbench::relspeed
