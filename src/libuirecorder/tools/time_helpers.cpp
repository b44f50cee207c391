
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>      // put_time, setw
#include <sstream>

#include "time_helpers.h"

std::string format_time_stamp(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    auto t = system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S");
    ss << '.';
    ss << std::setw(3) << std::setfill('0') << ms.count();

    return ss.str();
}

std::string format_utc_iso8601(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    auto us_since_epoch = duration_cast<microseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(us_since_epoch);
    auto us = us_since_epoch - secs;
    if (us.count() < 0)   // before the epoch
    {
        secs -= seconds(1);
        us += seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setw(6) << std::setfill('0') << us.count() << 'Z';
    return ss.str();
}

bool parse_utc_iso8601(const std::string& s,
                       std::chrono::system_clock::time_point& tp_out)
{
    using namespace std::chrono;

    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6)
        return false;

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    if (tm.tm_mon < 0 || tm.tm_mon > 11 ||
        tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
        return false;

    size_t pos = static_cast<size_t>(consumed);
    long long micros = 0;
    if (pos < s.size() && s[pos] == '.')
    {
        pos++;
        int ndigits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
        {
            if (ndigits < 6)
                micros = micros * 10 + (s[pos] - '0');
            ndigits++;
            pos++;
        }
        if (ndigits == 0 || ndigits > 9)
            return false;
        for (int i = ndigits; i < 6; i++)
            micros *= 10;
    }

    if (pos < s.size() && s[pos] == 'Z')
        pos++;
    if (pos != s.size())
        return false;

    std::time_t t = timegm(&tm);
    tp_out = system_clock::time_point(
                 duration_cast<system_clock::duration>(
                     seconds(t) + microseconds(micros)));
    return true;
}
