#ifndef ANCESTORPATH_H
#define ANCESTORPATH_H

#include <string>
#include <vector>

#include "uielement.h"
#include "uirecorderglobals.h"


// Names the chain of ancestors of an element.
class AncestorPathResolver : public ContextBase
{
    public:
        AncestorPathResolver(const ContextBase& context, size_t max_depth);

        // Ancestors of element, root-most first, excluding element itself.
        // Each entry is the ancestor's name, or its control type if unnamed.
        // At most max_depth entries. Never throws, a failed read ends
        // the walk with what was collected so far.
        std::vector<std::string> resolve(const UIElementPtr& element) const;

    private:
        std::string get_label(const UIElementPtr& element) const;

    private:
        size_t m_max_depth;
};

#endif // ANCESTORPATH_H
