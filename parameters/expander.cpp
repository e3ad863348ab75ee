#include "expander.hpp"

#include "../core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace cmdbench::params
{

namespace
{

std::string tooManyValues(const std::string& what)
{
    return "The " + what + " has more than " + std::to_string(kMaxScanValues) +
           " values";
}

std::vector<ParameterValue> integerRange(std::int64_t min, std::int64_t max,
                                         std::int64_t step,
                                         const std::string& what)
{
    // Unsigned arithmetic: max - min may not fit into int64 for wide bounds.
    const std::uint64_t base = static_cast<std::uint64_t>(min);
    const std::uint64_t ustep = static_cast<std::uint64_t>(step);
    const std::uint64_t count =
        (static_cast<std::uint64_t>(max) - base) / ustep;
    if (count >= kMaxScanValues)
        throw ConfigError(tooManyValues(what));

    std::vector<ParameterValue> out;
    out.reserve(static_cast<std::size_t>(count + 1));
    for (std::uint64_t i = 0; i <= count; ++i)
        out.emplace_back(static_cast<std::int64_t>(base + i * ustep));
    return out;
}

std::vector<ParameterValue> decimalRange(double min, double max, double step,
                                         int precision, const std::string& what)
{
    const long double span =
        (static_cast<long double>(max) - static_cast<long double>(min)) /
            static_cast<long double>(step) +
        1e-9L;
    if (!std::isfinite(span) ||
        span >= static_cast<long double>(kMaxScanValues))
        throw ConfigError(tooManyValues(what));

    std::vector<ParameterValue> out;
    const auto count = static_cast<std::uint64_t>(std::floor(span));
    out.reserve(static_cast<std::size_t>(count + 1));
    for (std::uint64_t i = 0; i <= count; ++i)
        out.emplace_back(
            Decimal{min + static_cast<double>(i) * step, precision});
    return out;
}

int precisionOf(const Number& n)
{
    if (const auto* d = std::get_if<Decimal>(&n))
        return d->precision;
    return 0;
}

std::vector<ParameterValue> scanValues(const ParameterScan& scan)
{
    const std::string what = "parameter scan '" + scan.name + "'";
    const Number min = toNumber(scan.min, what + " (min)");
    const Number max = toNumber(scan.max, what + " (max)");
    const Number step = scan.step ? toNumber(*scan.step, what + " (step)")
                                  : Number{std::int64_t{1}};

    if (asDouble(step) <= 0.0)
        throw ConfigError("The step size of " + what + " must be positive");
    if (asDouble(min) > asDouble(max))
        throw ConfigError("Empty range for " + what + ": min (" +
                          toString(scan.min) + ") is greater than max (" +
                          toString(scan.max) + ")");

    const bool integral = std::holds_alternative<std::int64_t>(min) &&
                          std::holds_alternative<std::int64_t>(max) &&
                          std::holds_alternative<std::int64_t>(step);
    if (integral)
    {
        return integerRange(std::get<std::int64_t>(min),
                            std::get<std::int64_t>(max),
                            std::get<std::int64_t>(step), what);
    }

    const int precision = std::max(
        {precisionOf(min), precisionOf(max), precisionOf(step)});
    return decimalRange(asDouble(min), asDouble(max), asDouble(step),
                        precision, what);
}

} // namespace

const std::string& axisName(const ParameterAxis& axis)
{
    return std::visit([](const auto& a) -> const std::string& { return a.name; },
                      axis);
}

std::vector<ParameterValue> axisValues(const ParameterAxis& axis)
{
    if (const auto* list = std::get_if<ParameterList>(&axis))
    {
        if (list->values.empty())
            throw ConfigError("The parameter list '" + list->name +
                              "' has no values");
        return list->values;
    }
    return scanValues(std::get<ParameterScan>(axis));
}

std::vector<Command> expandCommands(
    const std::vector<std::string>& templates,
    const std::vector<std::string>& nameTemplates,
    const std::vector<ParameterAxis>& axes)
{
    if (templates.empty())
        throw ConfigError("No command to benchmark was given");
    if (nameTemplates.size() > templates.size())
        throw ConfigError("Too many command names: " +
                          std::to_string(nameTemplates.size()) +
                          " names for " + std::to_string(templates.size()) +
                          " commands");

    std::set<std::string> seen;
    std::vector<std::vector<ParameterValue>> values;
    values.reserve(axes.size());
    for (const auto& axis : axes)
    {
        const std::string& name = axisName(axis);
        if (name.empty())
            throw ConfigError("A parameter name must not be empty");
        if (!seen.insert(name).second)
            throw ConfigError("Duplicate parameter name: '" + name + "'");
        values.push_back(axisValues(axis));
    }

    std::vector<Command> out;

    // Odometer over the axes; the last axis advances first.
    std::vector<std::size_t> index(axes.size(), 0);
    while (true)
    {
        Bindings bindings;
        bindings.reserve(axes.size());
        for (std::size_t a = 0; a < axes.size(); ++a)
            bindings.emplace_back(axisName(axes[a]), values[a][index[a]]);

        for (std::size_t t = 0; t < templates.size(); ++t)
        {
            Command cmd;
            cmd.shellText = substitute(templates[t], bindings);
            cmd.name = t < nameTemplates.size()
                           ? substitute(nameTemplates[t], bindings)
                           : cmd.shellText;
            cmd.parameters = bindings;
            out.push_back(std::move(cmd));
        }

        std::size_t a = axes.size();
        while (a > 0)
        {
            --a;
            if (++index[a] < values[a].size())
                break;
            index[a] = 0;
            if (a == 0)
                return out;
        }
        if (axes.empty())
            return out;
    }
}

} // namespace cmdbench::params
