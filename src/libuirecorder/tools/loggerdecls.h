#ifndef LOGGERDECLS_H
#define LOGGERDECLS_H

#include <string>

enum class LogLevel
{
    NONE,   // no logging
    CRITICAL,
    ERROR,
    WARNING,
    INFO,
    DEBUG,
    ATSPI,
    TRACE,
    EVENT,
};

std::string to_string(LogLevel e);

// Parse a level name, case-insensitive. Returns false for unknown names.
bool parse_log_level(const std::string& name, LogLevel& level_out);

#endif // LOGGERDECLS_H
