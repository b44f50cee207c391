#include <exception>

#include "tools/logger.h"

#include "periodictask.h"


PeriodicTask::PeriodicTask(const ContextBase& context,
                           const std::string& name,
                           std::chrono::milliseconds interval,
                           const TickFunc& tick_func) :
    ContextBase(context),
    m_name(name),
    m_interval(interval),
    m_tick_func(tick_func)
{}

PeriodicTask::~PeriodicTask()
{
    stop();
}

void PeriodicTask::start()
{
    if (m_thread.is_running())
        return;

    m_thread.start([this]{run();});
    m_thread.set_name(m_name);
    LOG_DEBUG << m_name << ": started, interval " << m_interval.count() << "ms";
}

void PeriodicTask::stop()
{
    if (m_thread.is_running())
    {
        if (!m_thread.stop())
            LOG_WARNING << m_name << ": failed to wake the thread";
        LOG_DEBUG << m_name << ": stopped after " << m_tick_count << " ticks";
    }
}

bool PeriodicTask::is_running() const
{
    return m_thread.is_running();
}

bool PeriodicTask::tick()
{
    m_tick_count++;
    try
    {
        m_tick_func();
        return true;
    }
    catch (const std::exception& ex)
    {
        m_failure_count++;
        LOG_WARNING << "[" << m_name << "][ERR] " << ex.what();
    }
    return false;
}

void PeriodicTask::run()
{
    try
    {
        while (!m_thread.is_stop_requested())
        {
            tick();
            if (!m_thread.sleep_for(m_interval))
                break;
        }
    }
    catch (const std::exception& ex)
    {
        // select() failed, nothing left to wait with
        LOG_ERROR << m_name << ": thread terminated: " << ex.what();
    }
}
