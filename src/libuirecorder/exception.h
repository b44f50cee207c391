#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>
#include <exception>

class Exception : public std::exception
{
    public:
        Exception(const std::string& msg):
            m_msg(msg)
        {}

        virtual ~Exception() noexcept;

        virtual const char* what() const noexcept
        {
           return m_msg.c_str();
        }

    protected:
        std::string m_msg;
};

class AtspiException : public Exception
{
    public:
        AtspiException(const std::string& msg):
            Exception(msg)
        {}
};

class PersistenceException : public Exception
{
    public:
        PersistenceException(const std::string& msg):
            Exception(msg)
        {}
};

class ProcessException : public Exception
{
   public:
       ProcessException(const std::string& msg):
           Exception(msg)
       {}
};

class ValueException : public Exception
{
    public:
        ValueException(const std::string& msg):
            Exception(msg)
        {}
};

class X11Exception : public Exception
{
    public:
        X11Exception(const std::string& msg):
            Exception(msg)
        {}
};

#endif // EXCEPTION_H
