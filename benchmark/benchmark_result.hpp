#pragma once

#include "../core/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cmdbench::bench
{

// Summary of all timing runs of one command. Built once after the sampling
// loop and not modified afterwards.
struct BenchmarkResult
{
    std::string command;
    Second mean{};
    std::optional<Second> stddev;
    Second median{};
    Second user{};   // mean user time
    Second system{}; // mean system time
    Second min{};
    Second max{};

    // Every wall-clock sample, in run order; absent when exports omit them.
    std::optional<std::vector<Second>> times;

    // One entry per run; empty optional when the code was not available.
    std::vector<std::optional<int>> exitCodes;

    // Parameter name -> rendered value, in declaration order.
    std::vector<std::pair<std::string, std::string>> parameters;
};

} // namespace cmdbench::bench
