#pragma once

#include "../core/types.hpp"
#include "../core/units.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cmdbench::bench
{

// Samples faster than this are dominated by measurement overhead.
inline constexpr Second kMinExecutionTime = 5e-3;

enum class WarningKind
{
    FastExecutionTime,
    NonZeroExitCode,
    SlowInitialRun,
    OutliersDetected,
};

struct Warning
{
    WarningKind kind;
    Second firstRunTime{}; // only meaningful for SlowInitialRun
};

// Independent checks first (fast execution, exit codes), then at most one
// outlier warning.
std::vector<Warning> collectWarnings(const std::vector<Second>& times,
                                     const std::vector<std::optional<int>>& exitCodes);

std::string describe(const Warning& w, std::optional<units::TimeUnit> unit);

} // namespace cmdbench::bench
