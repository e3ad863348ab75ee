#pragma once

#include "types.hpp"

#include <chrono>
#include <sys/time.h>

namespace cmdbench::timeutil
{

// Monotonic wall-clock stopwatch.
class WallClockTimer
{
  public:
    WallClockTimer() : begin(std::chrono::steady_clock::now()) {}

    Second elapsed() const
    {
        const auto d = std::chrono::steady_clock::now() - begin;
        return std::chrono::duration<double>(d).count();
    }

  private:
    std::chrono::steady_clock::time_point begin;
};

Second toSeconds(const struct timeval& tv);

} // namespace cmdbench::timeutil
