#ifndef TIME_HELPERS_H
#define TIME_HELPERS_H

#include <chrono>
#include <string>


std::string format_time_stamp(std::chrono::system_clock::time_point tp
                              =std::chrono::system_clock::now());

// UTC, ISO 8601 with microseconds and a trailing 'Z',
// e.g. 2024-05-01T10:11:12.123456Z
std::string format_utc_iso8601(std::chrono::system_clock::time_point tp);

// Accepts 0-9 fractional digits and an optional trailing 'Z'.
// Sub-microsecond digits are truncated.
bool parse_utc_iso8601(const std::string& s,
                       std::chrono::system_clock::time_point& tp_out);

#endif // TIME_HELPERS_H
