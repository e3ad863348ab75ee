#include "../benchmark/relative_speed.hpp"
#include "exporter.hpp"

#include <cstdio>
#include <sstream>

namespace cmdbench::exporter
{

namespace
{

std::string escapePipes(const std::string& s)
{
    std::string out;
    for (char c : s)
    {
        if (c == '|')
            out += "\\|";
        else
            out += c;
    }
    return out;
}

std::string relativeCell(const relspeed::ResultWithRelativeSpeed& entry)
{
    if (entry.isFastest)
        return "1.00";

    char buf[64];
    if (entry.relativeSpeedStddev)
        std::snprintf(buf, sizeof(buf), "%.2f ± %.2f", entry.relativeSpeed,
                      *entry.relativeSpeedStddev);
    else
        std::snprintf(buf, sizeof(buf), "%.2f", entry.relativeSpeed);
    return buf;
}

} // namespace

std::string MarkdownExporter::serialize(
    const std::vector<bench::BenchmarkResult>& results,
    std::optional<units::TimeUnit> unit) const
{
    // The first entry decides the unit when none was requested.
    const units::TimeUnit u = unit.value_or(
        results.empty() ? units::TimeUnit::Second
                        : units::pickUnit(results.front().mean));
    const std::string name = units::shortName(u);

    std::ostringstream out;
    out << "| Command | Mean [" << name << "] | Min [" << name << "] | Max ["
        << name << "] | Relative |\n";
    out << "|:---|---:|---:|---:|---:|\n";

    for (const auto& entry : relspeed::compute(results, SortOrder::Command))
    {
        const auto& r = *entry.result;
        out << "| `" << escapePipes(r.command) << "` | "
            << units::formatValue(r.mean, u);
        if (r.stddev)
            out << " ± " << units::formatValue(*r.stddev, u);
        out << " | " << units::formatValue(r.min, u) << " | "
            << units::formatValue(r.max, u) << " | " << relativeCell(entry)
            << " |\n";
    }
    return out.str();
}

} // namespace cmdbench::exporter
