#include "outlier_detection.hpp"

#include "../core/statistics.hpp"

#include <algorithm>
#include <cmath>

namespace cmdbench::outlier
{

double medianAbsoluteDeviation(const std::vector<double>& xs, double median)
{
    std::vector<double> deviations;
    deviations.reserve(xs.size());
    for (double x : xs)
        deviations.push_back(std::abs(x - median));
    return stats::calculateMedian(deviations);
}

std::vector<double> modifiedZScores(const std::vector<double>& xs)
{
    const double median = stats::calculateMedian(xs);
    const double mad = medianAbsoluteDeviation(xs, median);

    std::vector<double> scores(xs.size(), 0.0);
    if (mad == 0.0)
        return scores;

    for (std::size_t i = 0; i < xs.size(); ++i)
        scores[i] = 0.6745 * (xs[i] - median) / mad;
    return scores;
}

OutlierClass classify(const std::vector<double>& scores, double threshold)
{
    if (scores.empty())
        return OutlierClass::None;

    if (scores.front() > threshold)
        return OutlierClass::SlowInitialRun;

    const bool any = std::any_of(scores.begin(), scores.end(), [&](double s) {
        return std::abs(s) > threshold;
    });
    return any ? OutlierClass::OutliersDetected : OutlierClass::None;
}

} // namespace cmdbench::outlier
