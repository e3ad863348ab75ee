#include "parameter_value.hpp"

#include "../core/errors.hpp"
#include "../core/numeric.hpp"

#include <cmath>
#include <cstdio>
#include <type_traits>

namespace cmdbench::params
{

std::string toString(const ParameterValue& value)
{
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>)
            {
                return v;
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return std::to_string(v);
            }
            else
            {
                const int len =
                    std::snprintf(nullptr, 0, "%.*f", v.precision, v.value);
                std::string out(static_cast<std::size_t>(len), '\0');
                std::snprintf(out.data(), out.size() + 1, "%.*f", v.precision,
                              v.value);
                return out;
            }
        },
        value);
}

Number toNumber(const ParameterValue& value, const std::string& what)
{
    if (const auto* i = std::get_if<std::int64_t>(&value))
        return *i;
    if (const auto* d = std::get_if<Decimal>(&value))
        return *d;

    const auto& text = std::get<std::string>(value);
    if (auto i = numeric::parseInteger(text))
        return *i;
    if (auto d = numeric::parseDecimal(text))
        return Decimal{*d, numeric::fractionDigits(text)};

    throw ConfigError("Invalid number '" + text + "' for " + what);
}

std::int64_t toInteger(const ParameterValue& value, const std::string& what)
{
    const Number n = toNumber(value, what);
    if (const auto* i = std::get_if<std::int64_t>(&n))
        return *i;

    const double d = std::get<Decimal>(n).value;
    if (std::floor(d) != d || std::abs(d) > 9.0e15)
        throw ConfigError("Expected an integer for " + what + ", got '" +
                          toString(value) + "'");
    return static_cast<std::int64_t>(d);
}

double asDouble(const Number& n)
{
    if (const auto* i = std::get_if<std::int64_t>(&n))
        return static_cast<double>(*i);
    return std::get<Decimal>(n).value;
}

} // namespace cmdbench::params
