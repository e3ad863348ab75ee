#pragma once

#include "parameter_value.hpp"

#include <string>
#include <utility>
#include <vector>

namespace cmdbench::params
{

// Parameter bindings in declaration order.
using Bindings = std::vector<std::pair<std::string, ParameterValue>>;

// A fully expanded command, ready to run.
struct Command
{
    std::string name;      // display name
    std::string shellText; // text handed to the shell
    Bindings parameters;
};

// Replace every "{NAME}" in `text` by the bound value.
std::string substitute(const std::string& text, const Bindings& parameters);

// Bindings rendered as text, for results and exports.
std::vector<std::pair<std::string, std::string>>
    renderBindings(const Bindings& parameters);

} // namespace cmdbench::params
