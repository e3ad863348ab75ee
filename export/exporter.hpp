#pragma once

#include "../benchmark/benchmark_result.hpp"
#include "../core/units.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cmdbench::exporter
{

// Turns the final result set into a file format. Throws ExportError when
// the results cannot be encoded.
class Exporter
{
  public:
    virtual ~Exporter() = default;

    virtual std::string serialize(
        const std::vector<bench::BenchmarkResult>& results,
        std::optional<units::TimeUnit> unit) const = 0;
};

class JsonExporter : public Exporter
{
  public:
    std::string serialize(const std::vector<bench::BenchmarkResult>& results,
                          std::optional<units::TimeUnit> unit) const override;
};

class CsvExporter : public Exporter
{
  public:
    std::string serialize(const std::vector<bench::BenchmarkResult>& results,
                          std::optional<units::TimeUnit> unit) const override;
};

class MarkdownExporter : public Exporter
{
  public:
    std::string serialize(const std::vector<bench::BenchmarkResult>& results,
                          std::optional<units::TimeUnit> unit) const override;
};

} // namespace cmdbench::exporter
