#ifndef FAKEELEMENT_H
#define FAKEELEMENT_H

#include <memory>
#include <string>

#include "../uielement.h"


// Element with scripted property results.
class FakeElement : public UIElement
{
    public:
        using Ptr = std::shared_ptr<FakeElement>;

        FakeElement(const ContextBase& context) :
            UIElement(context)
        {}

        static Ptr make(const ContextBase& context,
                        const std::string& name_,
                        const std::string& control_type_="ControlType.Button",
                        int32_t pid=100,
                        const UIElementPtr& parent_=nullptr)
        {
            auto e = std::make_shared<FakeElement>(context);
            e->name = name_;
            e->control_type = control_type_;
            e->process_id = pid;
            e->parent = parent_;
            return e;
        }

        virtual std::ostream& dump(std::ostream& s) const override
        {
            s << "FakeElement(" << name << ")";
            return s;
        }

        virtual PropertyResult<std::string> get_name() const override {return name;}
        virtual PropertyResult<std::string> get_control_type() const override {return control_type;}
        virtual PropertyResult<std::string> get_class_name() const override {return class_name;}
        virtual PropertyResult<int32_t> get_process_id() const override {return process_id;}
        virtual PropertyResult<BoundingBox> get_bounding_box() const override {return bounding_box;}
        virtual PropertyResult<UIElementPtr> get_parent() const override {return parent;}

    public:
        PropertyResult<std::string> name{std::string()};
        PropertyResult<std::string> control_type{std::string("ControlType.Button")};
        PropertyResult<std::string> class_name{std::string()};
        PropertyResult<int32_t> process_id{-1};
        PropertyResult<BoundingBox> bounding_box{PropertyError::PROPERTY_UNAVAILABLE};
        PropertyResult<UIElementPtr> parent{UIElementPtr()};
};

#endif // FAKEELEMENT_H
