#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace tb::utils
{

// ISO-8601 UTC with microseconds, e.g. 2024-05-01T10:15:30.123456+00:00.
// Fixed width so lexical order matches chronological order.
inline std::string format_iso8601(std::chrono::system_clock::time_point when)
{
    auto const micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            when.time_since_epoch())
                            .count();
    auto seconds = micros / 1000000;
    auto fraction = micros % 1000000;
    if (fraction < 0)
    {
        fraction += 1000000;
        seconds -= 1;
    }
    auto const time = static_cast<std::time_t>(seconds);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    char date_buffer[32]{};
    std::strftime(date_buffer, sizeof(date_buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    char result[64]{};
    std::snprintf(result, sizeof(result), "%s.%06lld+00:00", date_buffer,
                  static_cast<long long>(fraction));
    return result;
}

inline std::int64_t to_unix_seconds(std::chrono::system_clock::time_point when)
{
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            when.time_since_epoch())
            .count());
}

} // namespace tb::utils
