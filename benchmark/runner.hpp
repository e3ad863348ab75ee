#pragma once

#include "../options/options.hpp"
#include "../parameters/command.hpp"
#include "../shell/executor.hpp"
#include "../shell/spawning_overhead.hpp"
#include "benchmark_result.hpp"
#include "progress.hpp"
#include "warnings.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cmdbench::bench
{

// Per-command protocol, strictly in this order.
enum class Phase
{
    Preparing,
    Warmup,
    Calibrating,
    Sampling,
    Cleanup,
    Done,
};

const char* phaseName(Phase p);

// max(minRuns, floor(minTime / estimate)), clamped to the optional maximum.
// A non-positive estimate plans the maximum if one is set, else minRuns.
std::uint64_t plannedRunCount(Second minTime, const RunBounds& runs,
                              Second perIterationEstimate);

// Aggregate corrected samples into a result.
BenchmarkResult summarize(const std::string& name,
                          const std::vector<TimingResult>& samples,
                          const std::vector<std::optional<int>>& exitCodes,
                          const params::Bindings& parameters);

struct BenchmarkOutcome
{
    BenchmarkResult result;
    std::vector<Warning> warnings;
    // Set when the cleanup command failed; the samples are still valid.
    std::optional<std::string> cleanupFailure;
};

// Runs the full measurement protocol for one command at a time.
class BenchmarkRunner
{
  public:
    BenchmarkRunner(const Options& options,
                    const shell::ShellSpawningOverhead& spawning,
                    shell::Executor& exec, ProgressSink& sink);

    // `index` selects the per-command preparation/cleanup command.
    // Throws SpawnError, CommandFailedError or PreparationError; any of them
    // aborts the whole run.
    BenchmarkOutcome run(std::size_t index, const params::Command& cmd);

    Phase phase() const
    {
        return current;
    }

  private:
    // Runs a preparation command (if any) and returns its corrected timing.
    TimingResult prepare(const std::optional<std::string>& cmd);

    TimingResult measure(const std::string& shellText,
                         std::vector<TimingResult>& samples,
                         std::vector<std::optional<int>>& exitCodes);

    const Options& opts;
    const shell::ShellSpawningOverhead& overhead;
    shell::Executor& executor;
    ProgressSink& progress;
    Phase current{Phase::Done};
};

} // namespace cmdbench::bench
