#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include "tools/logger.h"
#include "tools/signal_helpers.h"

#include "exception.h"
#include "uirecorder.h"


// recorder whose logger main() writes to, valid while main() runs
static UIRecorder* s_main_recorder{};

// recorder to persist if the process exits from elsewhere
static UIRecorder* s_recorder{};

static Logger* logger()
{
    if (s_main_recorder)
        return s_main_recorder->get_logger();
    return Logger::get_default().get();
}

static void on_exit()
{
    if (s_recorder)
        s_recorder->persist();
}

int main()
{
    std::cout << "UI event recorder starting..." << std::endl;
    std::cout << "Press ENTER to toggle 'foreground app only' filter. "
                 "Press Ctrl+C to exit." << std::endl << std::endl;

    std::unique_ptr<UIRecorder> recorder;
    int exit_code = EXIT_SUCCESS;
    try
    {
        ShutdownSignal shutdown_signal;

        recorder = UIRecorder::make();
        s_main_recorder = recorder.get();
        recorder->startup();

        s_recorder = recorder.get();
        std::atexit(on_exit);

        int signo = shutdown_signal.wait();
        LOG_DEBUG << "received signal " << signo;

        recorder->shutdown();
        s_recorder = nullptr;
    }
    catch (const AtspiException& ex)
    {
        LOG_CRITICAL << "accessibility unavailable: " << ex.what();
        exit_code = EXIT_FAILURE;
    }
    catch (const std::exception& ex)
    {
        LOG_CRITICAL << ex.what();
        exit_code = EXIT_FAILURE;
    }

    // persist now, the recorder is gone by the time exit hooks run
    if (s_recorder)
    {
        s_recorder->shutdown();
        s_recorder = nullptr;
    }
    s_main_recorder = nullptr;

    if (exit_code == EXIT_SUCCESS)
        std::cout << "UI event recorder stopped." << std::endl;
    return exit_code;
}
