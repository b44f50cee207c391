#ifndef UIELEMENT_H
#define UIELEMENT_H

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "tools/propertyresult.h"

#include "uievents.h"
#include "uirecorderglobals.h"

// Abstract base class of accessibles.
// Property reads race against the live UI and never throw, failures
// are reported through PropertyResult.
class UIElement : public ContextBase
{
    public:
        using Ptr = std::shared_ptr<UIElement>;
        UIElement(const ContextBase& context) :
            ContextBase(context)
        {}
        virtual ~UIElement()
        {}

        virtual std::ostream& dump(std::ostream& s) const = 0;

    public:
        virtual PropertyResult<std::string> get_name() const = 0;
        virtual PropertyResult<std::string> get_control_type() const = 0;  // e.g. "ControlType.Button"
        virtual PropertyResult<std::string> get_class_name() const = 0;
        virtual PropertyResult<int32_t> get_process_id() const = 0;
        virtual PropertyResult<BoundingBox> get_bounding_box() const = 0;  // screen coordinates

        // Parent in the unfiltered tree, nullptr at the root.
        virtual PropertyResult<Ptr> get_parent() const = 0;
};
typedef UIElement::Ptr UIElementPtr;


inline std::ostream& operator<<(std::ostream& s, const UIElement& e)
{
    return e.dump(s);
}

#endif // UIELEMENT_H
