#pragma once

#include "types.hpp"

#include <vector>

namespace cmdbench::stats
{

// All functions take the samples in measurement order and return 0.0 for an
// empty sequence.
double calculateMean(const std::vector<double>& data);

// Sample standard deviation (n - 1) around a precomputed mean; 0.0 for a
// single sample.
double calculateStdDev(const std::vector<double>& data, double mean);

// Midpoint of the sorted samples; the two central values are averaged for an
// even count.
double calculateMedian(const std::vector<double>& data);

double minimum(const std::vector<double>& data);
double maximum(const std::vector<double>& data);

// Mean of each component, used for the spawning overhead.
TimingResult meanTiming(const std::vector<TimingResult>& runs);

} // namespace cmdbench::stats
