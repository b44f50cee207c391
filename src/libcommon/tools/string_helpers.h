#ifndef STRING_HELPERS_H
#define STRING_HELPERS_H

#include <string>
#include <sstream>
#include <vector>

inline bool contains(const std::string s, const std::string search)
{
    return s.find(search) != std::string::npos;
}

// stream into string
class sstr
{
    public:
        template <typename T>
        sstr& operator << (const T& value)
        {
            m_stream << value;
            return *this;
        }

        operator std::string () const
        {
            return m_stream.str();
        }

    private:
        std::stringstream m_stream;
};

template<typename Out>
void split(const std::string &s, char delim, Out result) {
    std::stringstream ss;
    ss.str(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        *(result++) = item;
    }
}

std::vector<std::string> split(const std::string &s, char delim);

bool startswith(const std::string& s, const std::string& prefix);
bool endswith(const std::string& s, const std::string& suffix);

// Parses the whole string, returns false on garbage or overflow.
bool to_int(const std::string& s, int& value_out, int base=10);

std::string repr(const std::string& value);

// Don't let std::string and fs::path throw exceptions
// when assigning a nullptr.
inline std::string safe_assign(const char* s)
{
    if (s)
        return s;
    return {};
}

// UTF-8 aware functions
std::string strip(const std::string &s);
std::string lower(const std::string& s);

#endif // STRING_HELPERS_H
