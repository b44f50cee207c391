#ifndef LOGGER_H
#define LOGGER_H

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

#include "loggerdecls.h"


class Logger
{
    public:
        static std::shared_ptr<Logger> get_default();

        virtual ~Logger() = default;

        void set_level(LogLevel level);
        LogLevel get_level() const
        { return m_level; }
        bool can_log(LogLevel level) const
        { return level <= m_level; }

        virtual void write_prefix(std::ostream& stream, LogLevel level, const std::string& src_location) const = 0;

        // Serializes whole lines from the AT-SPI, poller and control threads.
        void write(const std::string& line) const;

    protected:
        virtual void output(const std::string& line) const = 0;

    private:
        // written by the main thread, read from AT-SPI and poller threads
        std::atomic<LogLevel> m_level{LogLevel::INFO};
        mutable std::mutex m_mutex;
};


// Writes "HH:MM:SS.mmm LEVEL class::function: message" lines,
// colored when out is stdout on a terminal.
class LoggerConsole : public Logger
{
    public:
        LoggerConsole(std::ostream& out=std::cout);

        virtual void write_prefix(std::ostream& stream, LogLevel level, const std::string& src_location) const override;

    protected:
        virtual void output(const std::string& line) const override;

    private:
        static bool stdout_wants_colors();

    private:
        std::ostream& m_out;
        bool m_use_colors{false};
};

class LogStream : public std::stringstream
{
    public:
        LogStream(const Logger* logger, LogLevel level, const char* const src_location);
        ~LogStream();
    private:
        const Logger* m_logger{};
};

#define LOG_SRC_LOCATION __PRETTY_FUNCTION__

#define LOG_CRITICAL LogStream(logger(), LogLevel::CRITICAL, LOG_SRC_LOCATION)
#define LOG_ERROR   LogStream(logger(), LogLevel::ERROR, LOG_SRC_LOCATION)
#define LOG_WARNING LogStream(logger(), LogLevel::WARNING, LOG_SRC_LOCATION)
#define LOG_INFO    LogStream(logger(), LogLevel::INFO, LOG_SRC_LOCATION)
#define LOG_DEBUG   LogStream(logger(), LogLevel::DEBUG, LOG_SRC_LOCATION)
#define LOG_TRACE   LogStream(logger(), LogLevel::TRACE, LOG_SRC_LOCATION)
#define LOG_ATSPI   LogStream(logger(), LogLevel::ATSPI, LOG_SRC_LOCATION)
#define LOG_EVENT   LogStream(logger(), LogLevel::EVENT, LOG_SRC_LOCATION)


// "Class::function" part of a __PRETTY_FUNCTION__ string.
std::string extract_src_location(const char* const src_location);

#endif // LOGGER_H
