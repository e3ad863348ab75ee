#pragma once

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

namespace cmdbench::numeric
{

// Parse a whole base-10 integer. Leading/trailing garbage is rejected.
inline std::optional<std::int64_t> parseInteger(const std::string& text)
{
    if (text.empty())
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size())
        return std::nullopt;
    return static_cast<std::int64_t>(v);
}

inline std::optional<std::uint64_t> parseUnsigned(const std::string& text)
{
    if (text.empty() || text.front() == '-')
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size())
        return std::nullopt;
    return static_cast<std::uint64_t>(v);
}

// Parse a finite floating value ("1.5", "-2", "1e-3").
inline std::optional<double> parseDecimal(const std::string& text)
{
    if (text.empty())
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size() ||
        !std::isfinite(v))
        return std::nullopt;
    return v;
}

// Number of digits after the decimal point a decimal literal needs when
// written without an exponent ("1.25" -> 2, "1e-05" -> 5, "1.5e3" -> 0).
inline int fractionDigits(const std::string& text)
{
    const auto expPos = text.find_first_of("eE");
    const std::string mantissa = text.substr(0, expPos);

    int n = 0;
    const auto dot = mantissa.find('.');
    if (dot != std::string::npos)
    {
        for (std::size_t i = dot + 1; i < mantissa.size(); ++i)
        {
            if (mantissa[i] < '0' || mantissa[i] > '9')
                break;
            ++n;
        }
    }

    if (expPos != std::string::npos)
    {
        if (auto exponent = parseInteger(text.substr(expPos + 1)))
        {
            const std::int64_t digits = n - *exponent;
            if (digits <= 0)
                return 0;
            return digits > 1000 ? 1000 : static_cast<int>(digits);
        }
    }
    return n;
}

// Truncate a non-negative ratio to a run count without overflowing.
inline std::uint64_t floorToCount(double value)
{
    if (!(value > 0.0))
        return 0;
    constexpr double cap =
        static_cast<double>(std::numeric_limits<std::uint32_t>::max());
    if (value >= cap)
        return static_cast<std::uint64_t>(cap);
    return static_cast<std::uint64_t>(std::floor(value));
}

} // namespace cmdbench::numeric
