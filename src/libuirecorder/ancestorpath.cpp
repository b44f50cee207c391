#include <deque>
#include <exception>

#include "tools/logger.h"

#include "ancestorpath.h"


AncestorPathResolver::AncestorPathResolver(const ContextBase& context, size_t max_depth) :
    ContextBase(context),
    m_max_depth(max_depth)
{}

std::vector<std::string> AncestorPathResolver::resolve(const UIElementPtr& element) const
{
    std::deque<std::string> path;
    try
    {
        UIElementPtr current = element;
        while (current && path.size() < m_max_depth)
        {
            auto parent = current->get_parent();
            if (!parent)
            {
                LOG_ATSPI << "parent of " << *current << ": " << parent.error()
                          << ", stopping at depth " << path.size();
                break;
            }
            if (!parent.value())
                break;   // reached the root

            path.emplace_front(get_label(parent.value()));
            current = parent.value();
        }
    }
    catch (const std::exception& ex)
    {
        LOG_ERROR << "ancestor walk failed at depth " << path.size() << ": " << ex.what();
    }
    return {path.begin(), path.end()};
}

std::string AncestorPathResolver::get_label(const UIElementPtr& element) const
{
    std::string name = element->get_name().value_or({});
    if (!name.empty())
        return name;
    return element->get_control_type().value_or(CONTROL_TYPE_UNKNOWN);
}
