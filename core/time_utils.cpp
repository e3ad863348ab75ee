#include "time_utils.hpp"

namespace cmdbench::timeutil
{

Second toSeconds(const struct timeval& tv)
{
    return static_cast<double>(tv.tv_sec) +
           static_cast<double>(tv.tv_usec) * 1e-6;
}

} // namespace cmdbench::timeutil
