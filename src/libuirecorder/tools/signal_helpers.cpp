#include <cerrno>
#include <stdexcept>
#include <string.h>  // strerror

#include <fcntl.h>
#include <unistd.h>

#include "tools/string_helpers.h"

#include "signal_helpers.h"


int ShutdownSignal::s_write_fd{-1};

ShutdownSignal::ShutdownSignal()
{
    int pipe_fds[2];
    if (pipe(pipe_fds) == -1)
        throw std::runtime_error(sstr()
                                 << "Failed to create pipe: "
                                 << strerror(errno) << " (" << errno << ")");
    m_read_fd = pipe_fds[0];
    s_write_fd = pipe_fds[1];

    // never block inside the signal handler
    int flags = fcntl(s_write_fd, F_GETFL, 0);
    fcntl(s_write_fd, F_SETFL, flags | O_NONBLOCK);

    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (sigaction(SIGINT, &sa, &m_old_sigint) == -1 ||
        sigaction(SIGTERM, &sa, &m_old_sigterm) == -1 ||
        sigaction(SIGHUP, &sa, &m_old_sighup) == -1)
    {
        int err = errno;
        sigaction(SIGINT, &m_old_sigint, nullptr);
        sigaction(SIGTERM, &m_old_sigterm, nullptr);
        ::close(m_read_fd);
        ::close(s_write_fd);
        s_write_fd = -1;
        throw std::runtime_error(sstr()
                                 << "sigaction failed: "
                                 << strerror(err) << " (" << err << ")");
    }
}

ShutdownSignal::~ShutdownSignal()
{
    sigaction(SIGINT, &m_old_sigint, nullptr);
    sigaction(SIGTERM, &m_old_sigterm, nullptr);
    sigaction(SIGHUP, &m_old_sighup, nullptr);
    ::close(m_read_fd);
    ::close(s_write_fd);
    s_write_fd = -1;
}

void ShutdownSignal::on_signal(int signo)
{
    int saved_errno = errno;
    unsigned char c = static_cast<unsigned char>(signo);
    if (s_write_fd >= 0 &&
        ::write(s_write_fd, &c, 1) != 1)
    {
        // pipe full, a shutdown is pending anyway
    }
    errno = saved_errno;
}

int ShutdownSignal::wait()
{
    while (true)
    {
        unsigned char c;
        ssize_t n = ::read(m_read_fd, &c, 1);
        if (n == 1)
            return c;
        if (n == -1 && errno == EINTR)
            continue;
        throw std::runtime_error(sstr()
                                 << "reading signal pipe failed: "
                                 << strerror(errno) << " (" << errno << ")");
    }
}
