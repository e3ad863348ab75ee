#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace cmdbench::params
{

// A decimal number together with the number of fraction digits it is
// displayed with ("0.50" keeps precision 2).
struct Decimal
{
    double value{};
    int precision{};
};

// Value bound to a parameter name: text, integer or decimal.
using ParameterValue = std::variant<std::string, std::int64_t, Decimal>;

// Numeric alternatives only.
using Number = std::variant<std::int64_t, Decimal>;

std::string toString(const ParameterValue& value);

// Fallible numeric view. Text is parsed as an integer first, then as a
// decimal; anything else raises ConfigError naming `what`.
Number toNumber(const ParameterValue& value, const std::string& what);

// Integer view; decimals with a fractional part are rejected.
std::int64_t toInteger(const ParameterValue& value, const std::string& what);

double asDouble(const Number& n);

} // namespace cmdbench::params
