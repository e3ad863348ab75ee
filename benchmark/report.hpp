#pragma once

#include "../core/types.hpp"
#include "../core/units.hpp"
#include "benchmark_result.hpp"
#include "warnings.hpp"

#include <optional>
#include <ostream>
#include <vector>

namespace cmdbench::bench
{

// "Benchmark N: <name>" with N counted from 1.
void printHeader(std::ostream& os, std::size_t index, const std::string& name);

// Mean/stddev with user and system time, then the range and run count.
void printResult(std::ostream& os, const BenchmarkResult& r,
                 std::optional<units::TimeUnit> unit);

void printWarnings(std::ostream& os, const std::vector<Warning>& warnings,
                   std::optional<units::TimeUnit> unit);

// Relative speed of every result against the fastest one.
void printSummary(std::ostream& os, const std::vector<BenchmarkResult>& results,
                  SortOrder order);

} // namespace cmdbench::bench
