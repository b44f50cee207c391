#ifndef TOOLS_CONTAINER_H
#define TOOLS_CONTAINER_H

#include <array>
#include <string>
#include <type_traits>
#include <utility>

// Look up key in a constant table of pairs, returns default_value
// if the key isn't found.
template <typename TKey, typename TValue, size_t N>
TValue lookup(const std::array<std::pair<TKey, TValue>, N>& a, const TKey& key,
              const typename std::decay<TValue>::type& default_value={})
{
    for (auto& e : a)
        if (e.first == key)
            return e.second;
    return default_value;
}

#endif // TOOLS_CONTAINER_H
