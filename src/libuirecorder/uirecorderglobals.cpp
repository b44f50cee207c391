#include "tools/logger.h"

#include "configuration.h"
#include "desktopprobe.h"
#include "eventaggregator.h"
#include "processfilter.h"
#include "uirecorderglobals.h"


RecorderGlobals::RecorderGlobals()
{}

RecorderGlobals::~RecorderGlobals()
{}

Logger* ContextBase::logger()
{
    if (m_globals && m_globals->m_logger)
        return m_globals->m_logger.get();
    return Logger::get_default().get();
}

const Logger* ContextBase::logger() const
{
    if (m_globals && m_globals->m_logger)
        return m_globals->m_logger.get();
    return Logger::get_default().get();
}
