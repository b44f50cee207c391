#include <cerrno>
#include <exception>
#include <string.h>  // strerror

#include <unistd.h>

#include "tools/logger.h"

#include "controlinput.h"


ControlInput::ControlInput(const ContextBase& context, int fd, const LineFunc& on_line) :
    ContextBase(context),
    m_fd(fd),
    m_on_line(on_line)
{}

ControlInput::~ControlInput()
{
    stop();
}

void ControlInput::start()
{
    if (m_thread.is_running())
        return;

    m_thread.start(m_fd, [this]{run();});
    m_thread.set_name("control-input");
}

void ControlInput::stop()
{
    if (m_thread.is_running())
    {
        if (!m_thread.stop())
            LOG_WARNING << "failed to wake the control input thread";
    }
}

void ControlInput::run()
{
    try
    {
        while (m_thread.wait_for_data())
        {
            if (!read_lines())
            {
                LOG_DEBUG << "end of control input, filter toggling disabled";
                break;
            }
        }
    }
    catch (const std::exception& ex)
    {
        LOG_ERROR << "control input: " << ex.what();
    }
}

bool ControlInput::read_lines()
{
    char buf[256];
    ssize_t n = ::read(m_fd, buf, sizeof(buf));
    if (n == 0)
        return false;
    if (n < 0)
    {
        if (errno == EINTR || errno == EAGAIN)
            return true;
        LOG_ERROR << "control input: read failed: " << strerror(errno);
        return false;
    }

    for (ssize_t i = 0; i < n; i++)
    {
        if (buf[i] == '\n')
        {
            try
            {
                m_on_line();
            }
            catch (const std::exception& ex)
            {
                LOG_ERROR << "control input: " << ex.what();
            }
        }
    }
    return true;
}
