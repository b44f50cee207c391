#ifndef THREADHELPERS_H
#define THREADHELPERS_H

#include <atomic>
#include <chrono>
#include <string>
#include <thread>


// Worker thread that can be woken up and stopped through a pipe,
// while waiting for data on another file descriptor or sleeping.
class ThreadFd
{
    private:
        // exception/safe file descriptor wrapper
        class Fd
        {
            public:
                Fd(int fd=-1) :
                    m_fd(fd) {}
                Fd(Fd& other) = delete;   // can only move
                Fd(Fd&& other) noexcept :
                    m_fd(other.m_fd)
                {
                    other.m_fd = -1;
                }
                ~Fd() {clear();}

                Fd& operator=(int fd)
                {
                    clear();
                    m_fd = fd;
                    return *this;
                }
                Fd& operator=(Fd&) = delete;  // can only move
                Fd& operator=(Fd&& other) noexcept
                {
                    clear();
                    m_fd = other.m_fd;
                    other.m_fd = -1;
                    return *this;
                }

                int get() const
                {
                    return m_fd;
                }

                void clear();

            private:
                int m_fd;
        };

    public:
        ThreadFd() = default;
        ~ThreadFd();

        // Start thread_func, which waits on poll_fd with wait_for_data().
        // poll_fd is not owned, e.g. stdin.
        // throws std::runtime_error
        template<typename F>
        void start(int poll_fd, const F& thread_func)
        {
            init();
            m_poll_fd = poll_fd;
            std::thread thread(thread_func);
            m_thread = std::move(thread);
        }

        // Start thread_func, which sleeps with sleep_for().
        // throws std::runtime_error
        template<typename F>
        void start(const F& thread_func)
        {
            start(-1, thread_func);
        }

        bool stop();
        bool is_running() const {return m_thread.joinable();}
        bool is_stop_requested() const {return m_stopping;}

        // Call this from the thread function.
        // Returns true when poll_fd has data, false when stop was requested.
        // throws std::runtime_error
        bool wait_for_data();

        // Call this from the thread function.
        // Returns false if woken up early because stop was requested.
        // throws std::runtime_error
        bool sleep_for(std::chrono::milliseconds duration);

        void set_name(const std::string& name);

    private:
        void init();
        void set_non_blocking(int fd);

        // Returns the fds that became readable, or none on timeout.
        int wait(int fd, timeval* timeout);

    private:
        int m_poll_fd{-1};
        std::thread m_thread;
        Fd m_exit_r;
        Fd m_exit_w;
        std::atomic<bool> m_stopping{false};
};

#endif // THREADHELPERS_H
