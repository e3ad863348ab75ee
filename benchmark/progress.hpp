#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace cmdbench::bench
{

// Receives progress notifications from the calibration and the runner.
// Implementations must not block; nothing measured depends on them.
// finish() may be called again after the bar is already finished.
class ProgressSink
{
  public:
    virtual ~ProgressSink() = default;

    virtual void start(std::uint64_t length, const std::string& message) = 0;
    virtual void setLength(std::uint64_t length) = 0;
    virtual void setMessage(const std::string& message) = 0;
    virtual void increment() = 0;
    virtual void finish() = 0;
};

class NullProgress : public ProgressSink
{
  public:
    void start(std::uint64_t, const std::string&) override {}
    void setLength(std::uint64_t) override {}
    void setMessage(const std::string&) override {}
    void increment() override {}
    void finish() override {}
};

// Single status line on stderr, redrawn with a carriage return.
class TerminalProgress : public ProgressSink
{
  public:
    void start(std::uint64_t length, const std::string& message) override;
    void setLength(std::uint64_t length) override;
    void setMessage(const std::string& message) override;
    void increment() override;
    void finish() override;

  private:
    void redraw();

    std::uint64_t total{0};
    std::uint64_t done{0};
    std::string text;
    std::size_t lastWidth{0};
    bool active{false};
};

std::unique_ptr<ProgressSink> makeProgressSink(OutputStyle style);

} // namespace cmdbench::bench
