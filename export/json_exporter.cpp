#include "../core/errors.hpp"
#include "exporter.hpp"

#include <nlohmann/json.hpp>

namespace cmdbench::exporter
{

using json = nlohmann::ordered_json;

namespace
{

json toJson(const bench::BenchmarkResult& r)
{
    json j;
    j["command"] = r.command;
    j["mean"] = r.mean;
    j["stddev"] = r.stddev ? json(*r.stddev) : json(nullptr);
    j["median"] = r.median;
    j["user"] = r.user;
    j["system"] = r.system;
    j["min"] = r.min;
    j["max"] = r.max;
    if (r.times)
        j["times"] = *r.times;

    json codes = json::array();
    for (const auto& c : r.exitCodes)
        codes.push_back(c ? json(*c) : json(nullptr));
    j["exit_codes"] = codes;

    json params = json::object();
    for (const auto& [name, value] : r.parameters)
        params[name] = value;
    j["parameters"] = params;
    return j;
}

} // namespace

// The JSON export always uses seconds.
std::string JsonExporter::serialize(
    const std::vector<bench::BenchmarkResult>& results,
    std::optional<units::TimeUnit>) const
{
    json root;
    root["results"] = json::array();
    for (const auto& r : results)
        root["results"].push_back(toJson(r));

    try
    {
        return root.dump(2) + "\n";
    }
    catch (const json::exception& e)
    {
        throw ExportError(std::string("JSON encoding failed: ") + e.what());
    }
}

} // namespace cmdbench::exporter
