#ifndef TESTCONTEXT_H
#define TESTCONTEXT_H

#include <memory>

#include "tools/logger.h"

#include "../configuration.h"
#include "../desktopprobe.h"
#include "../eventaggregator.h"
#include "../processfilter.h"
#include "../uirecorderglobals.h"


// Globals for unit tests: quiet logger, default config,
// empty aggregator, unfiltered process filter and no desktop probe.
class TestContext : public ContextBase
{
    public:
        TestContext(LogLevel log_level=LogLevel::WARNING) :
            ContextBase(nullptr),
            m_globals_ptr(std::make_unique<RecorderGlobals>())
        {
            m_globals = m_globals_ptr.get();

            m_globals_ptr->m_logger = std::make_shared<LoggerConsole>();
            m_globals_ptr->m_logger->set_level(log_level);
            m_globals_ptr->m_config = Config::make(*this);
            m_globals_ptr->m_event_aggregator = std::make_unique<EventAggregator>();
            m_globals_ptr->m_process_filter = std::make_unique<ProcessFilter>(*this);
        }

        template <class T>
        T* set_desktop_probe(std::unique_ptr<T> probe)
        {
            T* p = probe.get();
            m_globals_ptr->m_desktop_probe = std::move(probe);
            return p;
        }

    private:
        std::unique_ptr<RecorderGlobals> m_globals_ptr;
};

#endif // TESTCONTEXT_H
