#ifndef PROPERTYRESULT_H
#define PROPERTYRESULT_H

#include <ostream>
#include <string>
#include <utility>

// Why reading an accessible property failed.
enum class PropertyError
{
    NONE,
    PROPERTY_UNAVAILABLE,  // not supported by the element, or read failed
    STALE_ELEMENT,         // element is gone, e.g. window closed meanwhile
    ACCESS_DENIED,         // provider refused the request
};

std::string to_string(PropertyError e);

inline std::ostream& operator<<(std::ostream& s, PropertyError e)
{
    return s << to_string(e);
}


// Result of a property read from a live UI element. Either carries
// a value or the reason it couldn't be read. Never throws, callers
// choose their default with value_or().
template <class T>
class PropertyResult
{
    public:
        PropertyResult<T>(const T& value) :
            m_value(value)
        {}
        PropertyResult<T>(T&& value) :
            m_value(std::move(value))
        {}
        PropertyResult<T>(PropertyError error) :
            m_error(error)
        {}

        static PropertyResult<T> failure(PropertyError error)
        {
            return PropertyResult<T>(error);
        }

        bool ok() const
        {
            return m_error == PropertyError::NONE;
        }
        explicit operator bool() const
        {
            return ok();
        }

        PropertyError error() const
        {
            return m_error;
        }

        // Only meaningful if ok().
        const T& value() const
        {
            return m_value;
        }

        T value_or(const T& default_value) const
        {
            return ok() ? m_value : default_value;
        }

    private:
        T m_value{};
        PropertyError m_error{PropertyError::NONE};
};

template <class T>
std::ostream& operator<<(std::ostream& s, const PropertyResult<T>& r)
{
    if (r.ok())
        s << r.value();
    else
        s << "<" << r.error() << ">";
    return s;
}

#endif // PROPERTYRESULT_H
