#ifndef CONTROLINPUT_H
#define CONTROLINPUT_H

#include <functional>

#include "tools/thread_helpers.h"

#include "uirecorderglobals.h"


// Reads lines from a file descriptor, usually stdin, on its own
// thread and calls on_line for each one.
class ControlInput : public ContextBase
{
    public:
        using LineFunc = std::function<void()>;

        ControlInput(const ContextBase& context, int fd, const LineFunc& on_line);
        ~ControlInput();

        // throws std::runtime_error if the thread can't be set up
        void start();
        void stop();

        bool is_running() const {return m_thread.is_running();}

    private:
        void run();

        // Returns false at end of input.
        bool read_lines();

    private:
        int m_fd;
        LineFunc m_on_line;
        ThreadFd m_thread;
};

#endif // CONTROLINPUT_H
