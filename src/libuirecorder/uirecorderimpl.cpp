#include <exception>

#include <unistd.h>

#include "tools/logger.h"

#include "accessibilityeventsource.h"
#include "browsertabpoller.h"
#include "configuration.h"
#include "controlinput.h"
#include "desktopprobe.h"
#include "eventaggregator.h"
#include "eventlogwriter.h"
#include "exception.h"
#include "periodictask.h"
#include "pointerpoller.h"
#include "processfilter.h"
#include "uieventrecorder.h"
#include "uirecorderimpl.h"


std::unique_ptr<UIRecorder> UIRecorder::make()
{
    return std::make_unique<UIRecorderImpl>();
}

UIRecorderImpl::UIRecorderImpl() :
    Super(nullptr),
    m_globals_ptr(std::make_unique<RecorderGlobals>())
{
    m_globals = m_globals_ptr.get();
}

UIRecorderImpl::~UIRecorderImpl()
{
    stop_event_sources();
}

void UIRecorderImpl::init_essentials(LogLevel log_level)
{
    auto& globals = *m_globals_ptr;
    globals.m_logger = std::make_shared<LoggerConsole>();
    globals.m_logger->set_level(log_level);
    globals.m_config = Config::make(*this);
    globals.m_event_aggregator = std::make_unique<EventAggregator>();
    globals.m_process_filter = std::make_unique<ProcessFilter>(*this);

    m_event_log_writer = std::make_unique<EventLogWriter>(*this);
}

void UIRecorderImpl::startup()
{
    init_essentials(LogLevel::INFO);
    config()->load_environment();
    logger()->set_level(config()->get_log_level());

    std::unique_ptr<DesktopProbe> desktop_probe;
    try
    {
        desktop_probe = DesktopProbe::make_x11(*this);
    }
    catch (const X11Exception& ex)
    {
        LOG_WARNING << ex.what() << ", pointer and browser tracking "
                    << "and the foreground filter are unavailable";
    }

    start(AccessibilityEventSource::make_atspi(*this),
          std::move(desktop_probe));

    m_control_input = std::make_unique<ControlInput>(*this, STDIN_FILENO,
                                                     [this]{toggle_filter();});
    m_control_input->start();
}

void UIRecorderImpl::start(std::unique_ptr<AccessibilityEventSource> event_source,
                           std::unique_ptr<DesktopProbe> desktop_probe,
                           bool start_threads)
{
    m_globals_ptr->m_desktop_probe = std::move(desktop_probe);

    // Start with no filter (listen to the whole desktop)
    get_process_filter()->set_pid(0);

    m_pointer_poller = std::make_unique<PointerPoller>(*this);
    m_browser_tab_poller = std::make_unique<BrowserTabPoller>(*this);
    if (get_desktop_probe())
    {
        m_pointer_task = std::make_unique<PeriodicTask>(*this, "Mouse",
            config()->get_pointer_interval(),
            [this]{m_pointer_poller->poll();});
        m_browser_task = std::make_unique<PeriodicTask>(*this, "Browser",
            config()->get_browser_interval(),
            [this]{m_browser_tab_poller->poll();});
        if (start_threads)
        {
            m_pointer_task->start();
            m_browser_task->start();
        }
    }
    else
    {
        LOG_WARNING << "no X display, pointer and browser polling disabled";
    }

    m_ui_event_recorder = std::make_unique<UIEventRecorder>(*this);
    m_event_source = std::move(event_source);
    m_event_source->subscribe(m_ui_event_recorder.get());

    LOG_DEBUG << "recording, output directory " << config()->get_output_dir()
              << ", uia log mode " << to_string(m_event_log_writer->get_uia_log_mode());
}

void UIRecorderImpl::toggle_filter()
{
    get_process_filter()->toggle();
}

bool UIRecorderImpl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_shutdown_mutex);
        if (!m_shut_down)
        {
            stop_event_sources();
            m_shut_down = true;
        }
    }
    return persist();
}

bool UIRecorderImpl::persist()
{
    if (!m_event_log_writer)
        return false;
    return m_event_log_writer->write_all();
}

void UIRecorderImpl::stop_event_sources()
{
    if (m_event_source)
        m_event_source->unsubscribe();
    if (m_control_input)
        m_control_input->stop();
    if (m_pointer_task)
        m_pointer_task->stop();
    if (m_browser_task)
        m_browser_task->stop();
}
