#ifndef SIGNAL_HELPERS_H
#define SIGNAL_HELPERS_H

#include <signal.h>


// Turns SIGINT, SIGTERM and SIGHUP (terminal closed) into a readable
// pipe, so the main thread can block until it's time to shut down.
// Only one instance may exist at a time.
class ShutdownSignal
{
    public:
        // throws std::runtime_error
        ShutdownSignal();
        ~ShutdownSignal();

        ShutdownSignal(const ShutdownSignal&) = delete;
        ShutdownSignal& operator=(const ShutdownSignal&) = delete;

        // Blocks until one of the signals arrives, returns its number.
        // throws std::runtime_error
        int wait();

    private:
        static void on_signal(int signo);

    private:
        static int s_write_fd;
        int m_read_fd{-1};
        struct sigaction m_old_sigint{};
        struct sigaction m_old_sigterm{};
        struct sigaction m_old_sighup{};
};

#endif // SIGNAL_HELPERS_H
