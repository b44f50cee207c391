#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iterator>

#define U_CHARSET_IS_UTF8 1
#include <unicode/unistr.h>  // icu

#include "tools/string_helpers.h"

std::vector<std::string> split(const std::string& s, const char delim)
{
    std::vector<std::string> elems;
    split(s, delim, std::back_inserter(elems));
    return elems;
}

bool startswith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;  // search backwards from position 0
}

bool endswith(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           !s.compare(s.size()-suffix.size(), suffix.size(), suffix);
}

bool to_int(const std::string& s, int& value_out, int base)
{
    if (s.empty())
        return false;

    char* end = nullptr;
    errno = 0;
    long value = std::strtol(s.c_str(), &end, base);
    if (errno == ERANGE ||
        *end != '\0' ||
        value < INT_MIN || value > INT_MAX)
        return false;

    value_out = static_cast<int>(value);
    return true;
}

std::string repr(const std::string& value)
{
    return std::string("'") + value + "'";
}

// UTF-8 aware functions
std::string strip(const std::string &s)
{
    auto us = icu::UnicodeString::fromUTF8(s);
    std::string out;
    return us.trim().toUTF8String(out);
}

std::string lower(const std::string& s)
{
    auto us = icu::UnicodeString::fromUTF8(s);
    std::string out;
    return us.toLower().toUTF8String(out);
}
