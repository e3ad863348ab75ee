#pragma once

#include <cstdint>

namespace cmdbench
{

// Durations are plain seconds throughout.
using Second = double;

// One subprocess execution. All components are non-negative.
struct TimingResult
{
    Second real{0.0};   // wall clock
    Second user{0.0};   // CPU time in user mode
    Second system{0.0}; // CPU time in kernel mode
};

// What to do when a benchmarked command exits with a non-zero status.
enum class FailureAction
{
    RaiseError,
    Ignore,
};

enum class OutputStyle
{
    Full,  // results and progress line
    Basic, // results only
    None,  // warnings and errors only
};

enum class SortOrder
{
    Command,  // declaration order
    MeanTime, // ascending mean
};

} // namespace cmdbench
