#ifndef NONEABLE_H
#define NONEABLE_H

#include <ostream>

// Value that may be absent ("None"), e.g. optional record fields
// and poll results.
template <class T>
class Noneable
{
    public:
        Noneable<T>() = default;
        Noneable<T>(const T& val) :
            value(val),
            none(false)
        {}

        Noneable<T>& operator=(const Noneable<T>& other) = default;
        Noneable<T>& operator=(const T& val)
        {
            value = val;
            none = false;
            return *this;
        }

        // None equals None, regardless of the stale value
        bool operator==(const Noneable<T>& other) const
        {
            return none == other.none &&
                   (none || value == other.value);
        }
        bool operator!=(const Noneable<T>& other) const
        {
            return !operator==(other);
        }

        bool operator==(const T& val) const
        {
            return !none && value == val;
        }

        bool is_none() const
        {
            return none;
        }

        void set_none()
        {
            value = T{};
            none = true;
        }

        const T& get_or(const T& default_value) const
        {
            return none ? default_value : value;
        }

    public:
        T value{};
        bool none{true};
};

template<class T>
std::ostream& operator<<(std::ostream& s, const Noneable<T>& n)
{
    if (n.is_none())
        s << "None";
    else
        s << n.value;
    return s;
}

#endif // NONEABLE_H
