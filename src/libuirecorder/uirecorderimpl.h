#ifndef UIRECORDERIMPL_H
#define UIRECORDERIMPL_H

#include <memory>
#include <mutex>

#include "tools/loggerdecls.h"

#include "uirecorder.h"
#include "uirecorderglobals.h"

class AccessibilityEventSource;
class BrowserTabPoller;
class ControlInput;
class DesktopProbe;
class EventLogWriter;
class PeriodicTask;
class PointerPoller;
class UIEventRecorder;


class UIRecorderImpl : public UIRecorder,
                       public ContextBase
{
    public:
        using Super = ContextBase;

        UIRecorderImpl();
        virtual ~UIRecorderImpl();

        // init everything
        virtual void startup() override;

        // init bare essentials (for unit testing, mainly)
        void init_essentials(LogLevel log_level=LogLevel::WARNING);

        // Start recording from the given sources. desktop_probe may be
        // null, then pointer and browser polling and the filter degrade.
        // throws AtspiException
        void start(std::unique_ptr<AccessibilityEventSource> event_source,
                   std::unique_ptr<DesktopProbe> desktop_probe,
                   bool start_threads=true);

        virtual void toggle_filter() override;
        virtual bool shutdown() override;
        virtual bool persist() override;
        virtual Logger* get_logger() override {return logger();}

        PointerPoller* get_pointer_poller() {return m_pointer_poller.get();}
        BrowserTabPoller* get_browser_tab_poller() {return m_browser_tab_poller.get();}
        PeriodicTask* get_pointer_task() {return m_pointer_task.get();}
        PeriodicTask* get_browser_task() {return m_browser_task.get();}

    private:
        void stop_event_sources();

    private:
        std::unique_ptr<RecorderGlobals> m_globals_ptr;

        std::unique_ptr<AccessibilityEventSource> m_event_source;
        std::unique_ptr<UIEventRecorder> m_ui_event_recorder;
        std::unique_ptr<PointerPoller> m_pointer_poller;
        std::unique_ptr<BrowserTabPoller> m_browser_tab_poller;
        std::unique_ptr<PeriodicTask> m_pointer_task;
        std::unique_ptr<PeriodicTask> m_browser_task;
        std::unique_ptr<ControlInput> m_control_input;
        std::unique_ptr<EventLogWriter> m_event_log_writer;

        std::mutex m_shutdown_mutex;
        bool m_shut_down{false};
};

#endif // UIRECORDERIMPL_H
