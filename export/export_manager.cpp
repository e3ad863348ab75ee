#include "export_manager.hpp"

#include "../core/errors.hpp"

#include <filesystem>
#include <fstream>

namespace cmdbench::exporter
{

ExportManager ExportManager::fromTargets(const ExportTargets& t)
{
    ExportManager m;
    m.includeTimes = t.includeTimes;
    if (!t.csvPath.empty())
        m.add(std::make_unique<CsvExporter>(), t.csvPath);
    if (!t.jsonPath.empty())
        m.add(std::make_unique<JsonExporter>(), t.jsonPath);
    if (!t.markdownPath.empty())
        m.add(std::make_unique<MarkdownExporter>(), t.markdownPath);
    return m;
}

void ExportManager::add(std::unique_ptr<Exporter> exporter, std::string path)
{
    targets.emplace_back(std::move(exporter), std::move(path));
}

static void writeFile(const std::string& path, const std::string& content)
{
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
            throw ExportError("Could not create directory for '" + path +
                              "': " + ec.message());
    }

    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.good())
        throw ExportError("Could not open export file '" + path + "'");
    ofs << content;
    ofs.flush();
    if (!ofs.good())
        throw ExportError("Could not write export file '" + path + "'");
}

void ExportManager::writeResults(
    const std::vector<bench::BenchmarkResult>& results,
    std::optional<units::TimeUnit> unit) const
{
    if (targets.empty())
        return;

    std::vector<bench::BenchmarkResult> stripped;
    const auto* data = &results;
    if (!includeTimes)
    {
        stripped = results;
        for (auto& r : stripped)
            r.times.reset();
        data = &stripped;
    }

    for (const auto& [exporter, path] : targets)
        writeFile(path, exporter->serialize(*data, unit));
}

} // namespace cmdbench::exporter
