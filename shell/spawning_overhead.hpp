#pragma once

#include "../core/types.hpp"
#include "executor.hpp"

#include <cstdint>

namespace cmdbench::bench
{
class ProgressSink;
}

namespace cmdbench::shell
{

// Number of empty-shell runs used for calibration.
inline constexpr std::uint64_t kCalibrationRuns = 50;

// Mean cost of starting the shell, measured once per program run and shared
// read-only by every benchmark.
class ShellSpawningOverhead
{
  public:
    explicit ShellSpawningOverhead(const TimingResult& meanTiming) :
        overhead(meanTiming)
    {}

    const TimingResult& timing() const
    {
        return overhead;
    }

    // Subtract the overhead from each component, clamping at zero.
    TimingResult correct(const TimingResult& raw) const;

  private:
    TimingResult overhead;
};

// corrected = raw < overhead ? 0 : raw - overhead
Second subtractOverhead(Second raw, Second overhead);

// Run the empty command kCalibrationRuns times and average the timings.
// Throws CalibrationError if the shell cannot be run.
ShellSpawningOverhead calibrate(Executor& executor, bool showOutput,
                                bench::ProgressSink& progress);

} // namespace cmdbench::shell
