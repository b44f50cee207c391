
#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <string.h>  // strerror
#include <fcntl.h>
#include <pthread.h>
#include <unistd.h>
#include <sys/select.h>

#include "tools/string_helpers.h"

#include "thread_helpers.h"

enum WaitResult
{
    WAIT_TIMEOUT,
    WAIT_DATA,
    WAIT_EXIT,
};


void ThreadFd::Fd::clear()
{
    if (m_fd >= 0)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

ThreadFd::~ThreadFd()
{
    stop();
}

bool ThreadFd::stop()
{
    bool ret = true;
    if (m_thread.joinable())
    {
        m_stopping = true;
        if (m_exit_w.get() >= 0)
        {
            if (::write(m_exit_w.get(), "x", 1) != 1)
                ret = false;
        }
        if (m_thread.get_id() == std::this_thread::get_id())
            m_thread.detach();   // stopped from its own thread function
        else
            m_thread.join();
    }
    return ret;
}

void ThreadFd::init()
{
    int pipe_fds[2];
    if (pipe(pipe_fds) == -1)
    {
        throw std::runtime_error(sstr()
                                 << "Failed to create pipe: "
                                 << strerror(errno) << " (" << errno << ")");
    }
    m_exit_r = pipe_fds[0];
    m_exit_w = pipe_fds[1];

    set_non_blocking(m_exit_r.get());
    set_non_blocking(m_exit_w.get());

    m_stopping = false;
}

void ThreadFd::set_non_blocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int ThreadFd::wait(int fd, timeval* timeout)
{
    while (true)
    {
        int nfds = 0;
        fd_set readfds;
        FD_ZERO(&readfds);
        if (fd >= 0)
        {
            FD_SET(fd, &readfds);
            nfds = std::max(nfds, fd + 1);
        }

        FD_SET(m_exit_r.get(), &readfds);
        nfds = std::max(nfds, m_exit_r.get() + 1);

        int ret = select(nfds, &readfds, NULL, NULL, timeout);
        if (ret > 0)
        {
            if (FD_ISSET(m_exit_r.get(), &readfds))
                return WAIT_EXIT;
            if (fd >= 0 && FD_ISSET(fd, &readfds))
                return WAIT_DATA;
        }
        else if (ret == 0)
        {
            if (timeout)
                return WAIT_TIMEOUT;
        }
        else if (errno != EINTR)
        {
            throw std::runtime_error(sstr()
                                     << "select failed: "
                                     << strerror(errno) << " (" << errno << ")");
        }
    }
}

bool ThreadFd::wait_for_data()
{
    if (m_stopping)
        return false;
    return wait(m_poll_fd, nullptr) == WAIT_DATA;
}

bool ThreadFd::sleep_for(std::chrono::milliseconds duration)
{
    using namespace std::chrono;
    if (m_stopping)
        return false;

    // select() may modify timeval, recompute the remaining time
    // when interrupted by signals
    auto deadline = steady_clock::now() + duration;
    while (true)
    {
        auto remaining = duration_cast<microseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0)
            return true;

        timeval tv;
        tv.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);
        int result = wait(-1, &tv);
        if (result == WAIT_EXIT)
            return false;
        if (result == WAIT_TIMEOUT)
            return true;
    }
}

void ThreadFd::set_name(const std::string& name)
{
    auto handle = m_thread.native_handle();
    if (handle)
        pthread_setname_np(handle, name.substr(0, 15).c_str());
}
