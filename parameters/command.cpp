#include "command.hpp"

namespace cmdbench::params
{

std::string substitute(const std::string& text, const Bindings& parameters)
{
    std::string out = text;
    for (const auto& [name, value] : parameters)
    {
        const std::string token = "{" + name + "}";
        const std::string replacement = toString(value);

        std::size_t pos = 0;
        while ((pos = out.find(token, pos)) != std::string::npos)
        {
            out.replace(pos, token.size(), replacement);
            pos += replacement.size();
        }
    }
    return out;
}

std::vector<std::pair<std::string, std::string>>
    renderBindings(const Bindings& parameters)
{
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(parameters.size());
    for (const auto& [name, value] : parameters)
        out.emplace_back(name, toString(value));
    return out;
}

} // namespace cmdbench::params
