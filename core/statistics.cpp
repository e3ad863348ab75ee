#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace cmdbench::stats
{

double calculateMean(const std::vector<double>& data)
{
    if (data.empty())
        return 0.0;

    const double sum = std::accumulate(data.begin(), data.end(), 0.0);
    return sum / static_cast<double>(data.size());
}

double calculateStdDev(const std::vector<double>& data, double mean)
{
    const std::size_t n = data.size();
    if (n <= 1)
        return 0.0;

    double sumSqDiff = 0.0;
    for (double x : data)
    {
        const double diff = x - mean;
        sumSqDiff += diff * diff;
    }
    return std::sqrt(sumSqDiff / static_cast<double>(n - 1));
}

double calculateMedian(const std::vector<double>& data)
{
    if (data.empty())
        return 0.0;

    std::vector<double> sorted(data);
    std::sort(sorted.begin(), sorted.end());

    const std::size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1)
        return sorted[mid];
    return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

double minimum(const std::vector<double>& data)
{
    if (data.empty())
        return 0.0;
    return *std::min_element(data.begin(), data.end());
}

double maximum(const std::vector<double>& data)
{
    if (data.empty())
        return 0.0;
    return *std::max_element(data.begin(), data.end());
}

TimingResult meanTiming(const std::vector<TimingResult>& runs)
{
    std::vector<double> real, user, system;
    real.reserve(runs.size());
    user.reserve(runs.size());
    system.reserve(runs.size());
    for (const auto& r : runs)
    {
        real.push_back(r.real);
        user.push_back(r.user);
        system.push_back(r.system);
    }
    return TimingResult{calculateMean(real), calculateMean(user),
                        calculateMean(system)};
}

} // namespace cmdbench::stats
