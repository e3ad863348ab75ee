#include "config_file.hpp"

#include "../core/errors.hpp"
#include "../core/numeric.hpp"

#include <fstream>

namespace j = nlohmann;

namespace cmdbench
{

static std::uint64_t read_count(const j::json& obj, const char* key,
                                std::uint64_t def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    if (!it->is_number_unsigned())
        throw ConfigError(std::string("Config key '") + key +
                          "' must be a non-negative integer");
    return it->get<std::uint64_t>();
}

static double read_double(const j::json& obj, const char* key, double def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    if (!it->is_number())
        throw ConfigError(std::string("Config key '") + key +
                          "' must be a number");
    return it->get<double>();
}

static std::string read_string(const j::json& obj, const char* key,
                               const std::string& def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    if (!it->is_string())
        throw ConfigError(std::string("Config key '") + key +
                          "' must be a string");
    return it->get<std::string>();
}

static bool read_bool(const j::json& obj, const char* key, bool def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    if (!it->is_boolean())
        throw ConfigError(std::string("Config key '") + key +
                          "' must be true or false");
    return it->get<bool>();
}

// A single string or an array of strings.
static std::vector<std::string> read_strings(const j::json& obj,
                                             const char* key)
{
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end())
        return out;
    if (it->is_string())
    {
        out.push_back(it->get<std::string>());
        return out;
    }
    if (!it->is_array())
        throw ConfigError(std::string("Config key '") + key +
                          "' must be a string or an array of strings");
    for (const auto& v : *it)
    {
        if (!v.is_string())
            throw ConfigError(std::string("Config key '") + key +
                              "' must only contain strings");
        out.push_back(v.get<std::string>());
    }
    return out;
}

// JSON numbers keep their kind; a literal like 0.25 becomes a decimal with
// the precision of its shortest text form (1e-05 keeps five digits).
static params::ParameterValue toParameterValue(const j::json& v,
                                               const std::string& where)
{
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_number_integer())
        return v.get<std::int64_t>();
    if (v.is_number_float())
    {
        return params::Decimal{v.get<double>(),
                               numeric::fractionDigits(v.dump())};
    }
    throw ConfigError("Parameter value in " + where +
                      " must be a string or a number");
}

static params::ParameterAxis parseAxis(const j::json& p)
{
    if (!p.is_object())
        throw ConfigError("Each entry of 'parameters' must be an object");

    const std::string type = read_string(p, "type", "");
    const std::string name = read_string(p, "name", "");
    const std::string where = "parameter '" + name + "'";
    if (name.empty())
        throw ConfigError("Parameter entry without a 'name'");

    if (type == "list")
    {
        params::ParameterList list;
        list.name = name;
        auto it = p.find("values");
        if (it == p.end() || !it->is_array())
            throw ConfigError("List " + where + " needs a 'values' array");
        for (const auto& v : *it)
            list.values.push_back(toParameterValue(v, where));
        return list;
    }
    if (type == "scan")
    {
        params::ParameterScan scan;
        scan.name = name;
        if (!p.contains("min") || !p.contains("max"))
            throw ConfigError("Scan " + where + " needs 'min' and 'max'");
        scan.min = toParameterValue(p.at("min"), where);
        scan.max = toParameterValue(p.at("max"), where);
        if (p.contains("step"))
            scan.step = toParameterValue(p.at("step"), where);
        return scan;
    }
    throw ConfigError("Unknown type '" + type + "' for " + where +
                      " (expected 'list' or 'scan')");
}

void applyConfig(const j::json& root, Options& opts)
{
    if (!root.is_object())
        throw ConfigError("Configuration root must be a JSON object");

    for (auto& c : read_strings(root, "commands"))
        opts.commands.push_back(std::move(c));
    if (root.contains("names"))
        opts.commandNames = read_strings(root, "names");

    opts.warmupCount = read_count(root, "warmup", opts.warmupCount);
    opts.runs.min = read_count(root, "minRuns", opts.runs.min);
    if (root.contains("maxRuns"))
        opts.runs.max = read_count(root, "maxRuns", 0);
    if (root.contains("runs"))
    {
        const auto n = read_count(root, "runs", 0);
        opts.runs.min = n;
        opts.runs.max = n;
    }
    opts.minBenchmarkingTime =
        read_double(root, "minBenchmarkingTime", opts.minBenchmarkingTime);

    if (read_bool(root, "ignoreFailure", false))
        opts.failureAction = FailureAction::Ignore;

    if (root.contains("prepare"))
        opts.preparationCommands = read_strings(root, "prepare");
    if (root.contains("cleanup"))
        opts.cleanupCommands = read_strings(root, "cleanup");

    opts.shell = read_string(root, "shell", opts.shell);
    opts.showOutput = read_bool(root, "showOutput", opts.showOutput);

    if (root.contains("style"))
        opts.outputStyle = parseOutputStyle(read_string(root, "style", ""));
    if (root.contains("timeUnit"))
    {
        const std::string u = read_string(root, "timeUnit", "");
        opts.timeUnit = units::parseTimeUnit(u);
        if (!opts.timeUnit)
            throw ConfigError("Unknown time unit '" + u + "'");
    }
    if (root.contains("sort"))
        opts.sortOrder = parseSortOrder(read_string(root, "sort", ""));

    if (root.contains("parameters"))
    {
        const auto& ps = root["parameters"];
        if (!ps.is_array())
            throw ConfigError("Config key 'parameters' must be an array");
        for (const auto& p : ps)
            opts.parameters.push_back(parseAxis(p));
    }

    if (root.contains("export"))
    {
        const auto& ex = root["export"];
        if (!ex.is_object())
            throw ConfigError("Config key 'export' must be an object");
        opts.exports.csvPath = read_string(ex, "csv", opts.exports.csvPath);
        opts.exports.jsonPath = read_string(ex, "json", opts.exports.jsonPath);
        opts.exports.markdownPath =
            read_string(ex, "markdown", opts.exports.markdownPath);
        opts.exports.includeTimes =
            read_bool(ex, "includeTimes", opts.exports.includeTimes);
    }

    opts.logPath = read_string(root, "logPath", opts.logPath);
}

void loadConfigFile(const std::string& jsonPath, Options& opts)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw ConfigError("Cannot open config file: " + jsonPath);
    }

    j::json root;
    try
    {
        root = j::json::parse(ifs);
    }
    catch (const j::json::parse_error& e)
    {
        throw ConfigError("Cannot parse config file " + jsonPath + ": " +
                          e.what());
    }
    applyConfig(root, opts);
}

} // namespace cmdbench
