#include <array>
#include <cctype>
#include <chrono>
#include <cstring>
#include <iomanip>      // setw

#include <unistd.h>     // isatty
#include <sys/stat.h>   // fstat

#include "tools/string_helpers.h"

#include "logger.h"
#include "time_helpers.h"


namespace {

// ANSI escape sequences
const char* const TERM_RESET = "\x1b[0m";
const char* const TERM_BOLD = "\x1b[1m";

struct LevelInfo
{
    LogLevel level;
    const char* name;
    const char* color;
};

const std::array<LevelInfo, 9>& get_level_infos()
{
    static const std::array<LevelInfo, 9> a
    {{
        {LogLevel::NONE,     "NONE",     ""},
        {LogLevel::CRITICAL, "CRITICAL", "\x1b[31m"},    // red
        {LogLevel::ERROR,    "ERROR",    "\x1b[31m"},    // red
        {LogLevel::WARNING,  "WARNING",  "\x1b[33m"},    // yellow
        {LogLevel::INFO,     "INFO",     "\x1b[32m"},    // green
        {LogLevel::DEBUG,    "DEBUG",    "\x1b[34m"},    // blue
        {LogLevel::ATSPI,    "ATSPI",    "\x1b[36m"},    // cyan
        {LogLevel::TRACE,    "TRACE",    "\x1b[34m"},    // blue
        {LogLevel::EVENT,    "EVENT",    "\x1b[35m"},    // magenta
    }};
    return a;
}

const LevelInfo* find_level_info(LogLevel level)
{
    for (auto& info : get_level_infos())
        if (info.level == level)
            return &info;
    return nullptr;
}

}  // namespace


LogStream::LogStream(const Logger* logger, LogLevel level, const char* const src_location)
{
    if (logger->can_log(level))
    {
        m_logger = logger;
        m_logger->write_prefix(*this, level, extract_src_location(src_location));
    }
}

LogStream::~LogStream()
{
    if (m_logger)
        m_logger->write(this->str());
}

std::shared_ptr<Logger> Logger::get_default()
{
    static auto lg = std::make_shared<LoggerConsole>();
    return lg;
}

void Logger::set_level(LogLevel level)
{
    m_level = level;
}

void Logger::write(const std::string& line) const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    output(line);
}

LoggerConsole::LoggerConsole(std::ostream& out) :
    m_out(out)
{
    m_use_colors = &out == &std::cout && stdout_wants_colors();
}

bool LoggerConsole::stdout_wants_colors()
{
    if (isatty(fileno(stdout)))
        return true;

    // stdin and stdout both FIFOs, likely an IDE console
    struct stat stdin_stats;
    struct stat stdout_stats;
    return fstat(fileno(stdin), &stdin_stats) == 0 &&
           fstat(fileno(stdout), &stdout_stats) == 0 &&
           S_ISFIFO(stdin_stats.st_mode) &&
           S_ISFIFO(stdout_stats.st_mode);
}

void LoggerConsole::write_prefix(std::ostream& stream, LogLevel level, const std::string& src_location) const
{
    stream << format_time_stamp() << " ";

    auto info = find_level_info(level);
    if (m_use_colors && info)
        stream << info->color;
    stream << std::setw(7) << std::left << to_string(level);
    if (m_use_colors)
        stream << TERM_RESET << TERM_BOLD;
    stream << " " << std::setw(33) << std::left << (src_location + ": ");
    if (m_use_colors)
        stream << TERM_RESET;
}

void LoggerConsole::output(const std::string& line) const
{
    m_out << line << std::endl;
}

std::string to_string(LogLevel level)
{
    auto info = find_level_info(level);
    return info ? info->name : "";
}

bool parse_log_level(const std::string& name, LogLevel& level_out)
{
    std::string s = lower(strip(name));
    for (auto& info : get_level_infos())
    {
        if (lower(info.name) == s)
        {
            level_out = info.level;
            return true;
        }
    }
    return false;
}

std::string extract_src_location(const char* const src_location)
{
    const char* paren = std::strchr(src_location, '(');
    if (!paren)
        return {};

    const char* begin = paren;
    while (begin > src_location &&
           (std::isalnum(static_cast<unsigned char>(begin[-1])) ||
            begin[-1] == '_' || begin[-1] == ':'))
        begin--;
    return std::string(begin, paren);
}
