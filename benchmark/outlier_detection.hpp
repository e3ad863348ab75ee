#pragma once

#include <vector>

namespace cmdbench::outlier
{

// Modified z-scores above this value are treated as outliers.
inline constexpr double kOutlierThreshold = 3.5;

enum class OutlierClass
{
    None,
    SlowInitialRun,   // the first sample alone is an outlier
    OutliersDetected, // some other sample is
};

double medianAbsoluteDeviation(const std::vector<double>& xs, double median);

// 0.6745 * (x - median) / MAD per sample; all zero when MAD is zero.
std::vector<double> modifiedZScores(const std::vector<double>& xs);

// The first-run check wins over the generic one; the generic check uses the
// absolute score.
OutlierClass classify(const std::vector<double>& scores,
                      double threshold = kOutlierThreshold);

} // namespace cmdbench::outlier
