#include <exception>

#include "tools/logger.h"
#include "tools/process_helpers.h"

#include "desktopprobe.h"
#include "exception.h"
#include "processfilter.h"


std::ostream& operator<<(std::ostream& s, const ProcessFilterState& state)
{
    if (state.enabled)
        s << "Foreground-Only(pid=" << state.pid << ")";
    else
        s << "Unfiltered";
    return s;
}

ProcessFilter::ProcessFilter(const ContextBase& context) :
    ContextBase(context)
{}

ProcessFilterState ProcessFilter::toggle()
{
    if (get_state().enabled)
    {
        set_pid(0);
        LOG_INFO << "[Filter] Listening to ALL processes.";
        return get_state();
    }

    int32_t pid = 0;
    auto probe = get_desktop_probe();
    if (probe)
    {
        try
        {
            pid = probe->get_foreground_pid().get_or(0);
        }
        catch (const X11Exception& ex)
        {
            LOG_WARNING << "[Filter] foreground window lookup failed: " << ex.what();
        }
    }
    else
    {
        LOG_WARNING << "[Filter] no X display, can't find the foreground window";
    }

    if (pid <= 0)
    {
        set_pid(0);
        LOG_INFO << "[Filter] No foreground window found; still listening to ALL.";
        return get_state();
    }

    set_pid(pid);

    std::string process_name;
    try
    {
        process_name = Process::get_process_name(pid);
    }
    catch (const ProcessException& ex)
    {
        LOG_DEBUG << ex.what();
    }
    LOG_INFO << "[Filter] Foreground-only mode ON (PID=" << pid << ")"
             << (process_name.empty() ? "" : " " + process_name) << ".";

    return get_state();
}

void ProcessFilter::set_pid(int32_t pid)
{
    m_pid.store(pid > 0 ? pid : 0, std::memory_order_relaxed);
}

ProcessFilterState ProcessFilter::get_state() const
{
    int32_t pid = m_pid.load(std::memory_order_relaxed);
    return {pid > 0, pid};
}

bool ProcessFilter::passes(const PropertyResult<int32_t>& pid) const
{
    int32_t filter_pid = m_pid.load(std::memory_order_relaxed);
    if (filter_pid <= 0)
        return true;
    return pid.ok() && pid.value() == filter_pid;
}
