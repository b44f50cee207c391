#ifndef UIRECORDERGLOBALS_H
#define UIRECORDERGLOBALS_H

#include <memory>

class Config;
class DesktopProbe;
class EventAggregator;
class Logger;
class ProcessFilter;


// Everything shared between the AT-SPI callback thread, the pollers
// and the control thread. Created once per recorder.
class RecorderGlobals
{
    public:
        RecorderGlobals();
        ~RecorderGlobals();

    private:
        std::shared_ptr<Logger> m_logger;
        std::unique_ptr<Config> m_config;

        std::unique_ptr<EventAggregator> m_event_aggregator;
        std::unique_ptr<ProcessFilter> m_process_filter;
        std::unique_ptr<DesktopProbe> m_desktop_probe;   // null without X display

        friend class ContextBase;
        friend class UIRecorderImpl;
        friend class TestContext;
};

// Base class for transporting global settings deep into the class hierarchy
class ContextBase
{
    public:
        ContextBase(RecorderGlobals* globals) :
            m_globals(globals)
        {}

        Logger* logger();
        const Logger* logger() const;

        Config* config() {return m_globals->m_config.get();}
        const Config* config() const {return m_globals->m_config.get();}

        EventAggregator* get_event_aggregator() {return m_globals->m_event_aggregator.get();}
        ProcessFilter* get_process_filter() {return m_globals->m_process_filter.get();}
        DesktopProbe* get_desktop_probe() {return m_globals->m_desktop_probe.get();}

    public:
        RecorderGlobals* m_globals{};     // weak pointer to the one held by UIRecorderImpl
};

#endif // UIRECORDERGLOBALS_H
