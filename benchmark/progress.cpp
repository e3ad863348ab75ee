#include "progress.hpp"

#include <iostream>
#include <sstream>

namespace cmdbench::bench
{

void TerminalProgress::start(std::uint64_t length, const std::string& message)
{
    total = length;
    done = 0;
    text = message;
    active = true;
    redraw();
}

void TerminalProgress::setLength(std::uint64_t length)
{
    total = length;
    redraw();
}

void TerminalProgress::setMessage(const std::string& message)
{
    text = message;
    redraw();
}

void TerminalProgress::increment()
{
    ++done;
    redraw();
}

void TerminalProgress::finish()
{
    if (!active)
        return;
    // Clear the line so results start in column 0.
    std::cerr << '\r' << std::string(lastWidth, ' ') << '\r' << std::flush;
    lastWidth = 0;
    active = false;
}

void TerminalProgress::redraw()
{
    if (!active)
        return;

    std::ostringstream line;
    line << "  " << text << "  " << done << "/" << total;
    const std::string s = line.str();
    std::cerr << '\r' << s;
    if (s.size() < lastWidth)
        std::cerr << std::string(lastWidth - s.size(), ' ');
    std::cerr << std::flush;
    lastWidth = s.size();
}

std::unique_ptr<ProgressSink> makeProgressSink(OutputStyle style)
{
    switch (style)
    {
        case OutputStyle::Full:
            return std::make_unique<TerminalProgress>();
        case OutputStyle::Basic:
        case OutputStyle::None:
            return std::make_unique<NullProgress>();
    }
    return std::make_unique<NullProgress>();
}

} // namespace cmdbench::bench
