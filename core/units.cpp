#include "units.hpp"

#include <cstdio>

namespace cmdbench::units
{

std::string shortName(TimeUnit unit)
{
    switch (unit)
    {
        case TimeUnit::Second:
            return "s";
        case TimeUnit::MilliSecond:
            return "ms";
    }
    return "s";
}

std::string formatValue(Second value, TimeUnit unit)
{
    char buf[64];
    switch (unit)
    {
        case TimeUnit::Second:
            std::snprintf(buf, sizeof(buf), "%.3f", value);
            break;
        case TimeUnit::MilliSecond:
            std::snprintf(buf, sizeof(buf), "%.1f", value * 1e3);
            break;
    }
    return std::string(buf);
}

TimeUnit pickUnit(Second value)
{
    return value < 1.0 ? TimeUnit::MilliSecond : TimeUnit::Second;
}

std::pair<std::string, TimeUnit> formatDuration(Second value,
                                                std::optional<TimeUnit> unit)
{
    const TimeUnit u = unit.value_or(pickUnit(value));
    return {formatValue(value, u) + " " + shortName(u), u};
}

std::optional<TimeUnit> parseTimeUnit(const std::string& text)
{
    if (text == "second" || text == "s")
        return TimeUnit::Second;
    if (text == "millisecond" || text == "ms")
        return TimeUnit::MilliSecond;
    return std::nullopt;
}

} // namespace cmdbench::units
