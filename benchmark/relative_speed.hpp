#pragma once

#include "../core/types.hpp"
#include "benchmark_result.hpp"

#include <optional>
#include <vector>

namespace cmdbench::relspeed
{

// A result compared against the fastest result of the same set.
struct ResultWithRelativeSpeed
{
    const bench::BenchmarkResult* result{};
    double relativeSpeed{};
    std::optional<double> relativeSpeedStddev; // absent if a stddev is unknown
    bool isFastest{};
};

// Index of the first result with the smallest mean. `results` must not be
// empty.
std::size_t fastestIndex(const std::vector<bench::BenchmarkResult>& results);

// Ratios to the fastest mean with propagated uncertainty. Returns nothing
// when the fastest mean is zero.
std::optional<std::vector<ResultWithRelativeSpeed>> computeWithCheck(
    const std::vector<bench::BenchmarkResult>& results, SortOrder order);

// Same, but a zero fastest mean gives 1.0 for every zero-mean result and
// +infinity for every other one.
std::vector<ResultWithRelativeSpeed> compute(
    const std::vector<bench::BenchmarkResult>& results, SortOrder order);

} // namespace cmdbench::relspeed
