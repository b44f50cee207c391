#ifndef PERIODICTASK_H
#define PERIODICTASK_H

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include "tools/thread_helpers.h"

#include "uirecorderglobals.h"


// Calls a tick function at a fixed interval on its own thread until
// stopped. A failing tick is logged and skipped, the task keeps running.
class PeriodicTask : public ContextBase
{
    public:
        using TickFunc = std::function<void()>;

        PeriodicTask(const ContextBase& context,
                     const std::string& name,
                     std::chrono::milliseconds interval,
                     const TickFunc& tick_func);
        PeriodicTask(const PeriodicTask& other) = delete;
        PeriodicTask& operator=(const PeriodicTask& other) = delete;
        virtual ~PeriodicTask();

        // throws std::runtime_error if the thread can't be set up
        void start();

        // Wakes the thread and waits for the tick in progress, if any.
        void stop();

        bool is_running() const;

        // Run the tick function once on the calling thread.
        // Returns false if it failed.
        bool tick();

        const std::string& get_name() const {return m_name;}
        std::chrono::milliseconds get_interval() const {return m_interval;}
        size_t get_tick_count() const {return m_tick_count;}
        size_t get_failure_count() const {return m_failure_count;}

    private:
        void run();

    private:
        std::string m_name;
        std::chrono::milliseconds m_interval;
        TickFunc m_tick_func;
        ThreadFd m_thread;
        std::atomic<size_t> m_tick_count{0};
        std::atomic<size_t> m_failure_count{0};
};

#endif // PERIODICTASK_H
