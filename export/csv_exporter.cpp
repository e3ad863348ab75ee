#include "exporter.hpp"

#include <sstream>

namespace cmdbench::exporter
{

namespace
{

std::string csvField(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;

    std::string out = "\"";
    for (char c : field)
    {
        if (c == '"')
            out += "\"\"";
        else
            out += c;
    }
    out += '"';
    return out;
}

std::string number(double v)
{
    std::ostringstream oss;
    oss.precision(17);
    oss << v;
    return oss.str();
}

} // namespace

// Values are written in seconds regardless of the display unit.
std::string CsvExporter::serialize(
    const std::vector<bench::BenchmarkResult>& results,
    std::optional<units::TimeUnit>) const
{
    std::ostringstream out;
    out << "command,mean,stddev,median,user,system,min,max";

    std::vector<std::string> paramNames;
    if (!results.empty())
    {
        for (const auto& p : results.front().parameters)
        {
            paramNames.push_back(p.first);
            out << "," << csvField("parameter_" + p.first);
        }
    }
    out << "\n";

    for (const auto& r : results)
    {
        out << csvField(r.command) << "," << number(r.mean) << ","
            << (r.stddev ? number(*r.stddev) : std::string{}) << ","
            << number(r.median) << "," << number(r.user) << ","
            << number(r.system) << "," << number(r.min) << ","
            << number(r.max);

        for (const auto& name : paramNames)
        {
            std::string value;
            for (const auto& [n, v] : r.parameters)
            {
                if (n == name)
                    value = v;
            }
            out << "," << csvField(value);
        }
        out << "\n";
    }
    return out.str();
}

} // namespace cmdbench::exporter
