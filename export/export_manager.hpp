#pragma once

#include "../options/options.hpp"
#include "exporter.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cmdbench::exporter
{

// Holds the requested export targets and writes all of them once the
// benchmarks are done.
class ExportManager
{
  public:
    static ExportManager fromTargets(const ExportTargets& targets);

    void add(std::unique_ptr<Exporter> exporter, std::string path);

    bool empty() const
    {
        return targets.empty();
    }

    // Throws ExportError naming the first file that could not be written.
    void writeResults(const std::vector<bench::BenchmarkResult>& results,
                      std::optional<units::TimeUnit> unit) const;

  private:
    std::vector<std::pair<std::unique_ptr<Exporter>, std::string>> targets;
    bool includeTimes{true};
};

} // namespace cmdbench::exporter
