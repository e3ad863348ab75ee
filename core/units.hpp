#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace cmdbench::units
{

enum class TimeUnit
{
    Second,
    MilliSecond,
};

// "s" or "ms".
std::string shortName(TimeUnit unit);

// Numeric part only: seconds with 3 decimals, milliseconds with 1.
std::string formatValue(Second value, TimeUnit unit);

// Value with its unit suffix. Without an explicit unit, values below one
// second are shown in milliseconds.
std::pair<std::string, TimeUnit> formatDuration(Second value,
                                                std::optional<TimeUnit> unit);

TimeUnit pickUnit(Second value);

// Accepts "second"/"s" and "millisecond"/"ms".
std::optional<TimeUnit> parseTimeUnit(const std::string& text);

} // namespace cmdbench::units
