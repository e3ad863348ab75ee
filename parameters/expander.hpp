#pragma once

#include "command.hpp"
#include "parameter_value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cmdbench::params
{

// Upper bound on the number of values a single scan may produce.
inline constexpr std::uint64_t kMaxScanValues = 1000000;

// Parameter bound successively to each listed value.
struct ParameterList
{
    std::string name;
    std::vector<ParameterValue> values;
};

// Parameter bound to every value of [min, max] in increments of `step`
// (1 when absent). Integer bounds and step give an integer range.
struct ParameterScan
{
    std::string name;
    ParameterValue min;
    ParameterValue max;
    std::optional<ParameterValue> step;
};

using ParameterAxis = std::variant<ParameterList, ParameterScan>;

const std::string& axisName(const ParameterAxis& axis);

// All values of one axis, in ascending/declaration order. A scan spanning
// kMaxScanValues or more values is a ConfigError.
std::vector<ParameterValue> axisValues(const ParameterAxis& axis);

// Cartesian product of all axes (first axis slowest) crossed with the
// command templates (fastest). Display names come from `nameTemplates`
// where given, else from the substituted command text.
// Throws ConfigError for duplicate parameter names, empty or malformed axes
// and more names than templates.
std::vector<Command> expandCommands(
    const std::vector<std::string>& templates,
    const std::vector<std::string>& nameTemplates,
    const std::vector<ParameterAxis>& axes);

} // namespace cmdbench::params
