#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

#include <atspi/atspi.h>

#include "tools/container_helpers.h"
#include "tools/glib_helpers.h"
#include "tools/logger.h"
#include "tools/noneable.h"
#include "tools/string_helpers.h"

#include "accessibilityeventsource.h"
#include "atspieventsource.h"
#include "exception.h"
#include "uielement.h"


#define CACHED_GET(state_value, func_name) \
cached_get(state_value, \
           [](AtspiAccessible* accessible, GError** error) \
               {return func_name(accessible, error);}, \
           "\"" #func_name "\"")  \

typedef std::shared_ptr<AtspiAccessible> AtspiAccessiblePtr;
typedef std::shared_ptr<AtspiEventListener> AtspiListenerPtr;
typedef std::unique_ptr<AtspiComponent, decltype(&g_object_unref)> AtspiIFaceComponentPtr;
typedef std::unique_ptr<AtspiRect, decltype(&g_free)> AtspiRectPtr;

static void free_atspi_event(AtspiEvent* event)
{
    g_boxed_free(ATSPI_TYPE_EVENT, event);
}
typedef std::unique_ptr<AtspiEvent, decltype(&free_atspi_event)> AtspiEventPtr;


static const std::array<std::pair<AtspiRole, const char*>, 60>& get_control_types()
{
    static const std::array<std::pair<AtspiRole, const char*>, 60> a
    {{
        {ATSPI_ROLE_ALERT, "ControlType.Window"},
        {ATSPI_ROLE_APPLICATION, "ControlType.Window"},
        {ATSPI_ROLE_CALENDAR, "ControlType.Calendar"},
        {ATSPI_ROLE_CHECK_BOX, "ControlType.CheckBox"},
        {ATSPI_ROLE_CHECK_MENU_ITEM, "ControlType.MenuItem"},
        {ATSPI_ROLE_COLUMN_HEADER, "ControlType.HeaderItem"},
        {ATSPI_ROLE_COMBO_BOX, "ControlType.ComboBox"},
        {ATSPI_ROLE_DESKTOP_FRAME, "ControlType.Pane"},
        {ATSPI_ROLE_DIALOG, "ControlType.Window"},
        {ATSPI_ROLE_DOCUMENT_EMAIL, "ControlType.Document"},
        {ATSPI_ROLE_DOCUMENT_FRAME, "ControlType.Document"},
        {ATSPI_ROLE_DOCUMENT_PRESENTATION, "ControlType.Document"},
        {ATSPI_ROLE_DOCUMENT_SPREADSHEET, "ControlType.Document"},
        {ATSPI_ROLE_DOCUMENT_TEXT, "ControlType.Document"},
        {ATSPI_ROLE_DOCUMENT_WEB, "ControlType.Document"},
        {ATSPI_ROLE_ENTRY, "ControlType.Edit"},
        {ATSPI_ROLE_FILE_CHOOSER, "ControlType.Window"},
        {ATSPI_ROLE_FILLER, "ControlType.Pane"},
        {ATSPI_ROLE_FORM, "ControlType.Group"},
        {ATSPI_ROLE_FRAME, "ControlType.Window"},
        {ATSPI_ROLE_GROUPING, "ControlType.Group"},
        {ATSPI_ROLE_HEADER, "ControlType.Header"},
        {ATSPI_ROLE_HEADING, "ControlType.Text"},
        {ATSPI_ROLE_ICON, "ControlType.Image"},
        {ATSPI_ROLE_IMAGE, "ControlType.Image"},
        {ATSPI_ROLE_LABEL, "ControlType.Text"},
        {ATSPI_ROLE_LINK, "ControlType.Hyperlink"},
        {ATSPI_ROLE_LIST, "ControlType.List"},
        {ATSPI_ROLE_LIST_BOX, "ControlType.List"},
        {ATSPI_ROLE_LIST_ITEM, "ControlType.ListItem"},
        {ATSPI_ROLE_MENU, "ControlType.Menu"},
        {ATSPI_ROLE_MENU_BAR, "ControlType.MenuBar"},
        {ATSPI_ROLE_MENU_ITEM, "ControlType.MenuItem"},
        {ATSPI_ROLE_PAGE_TAB, "ControlType.TabItem"},
        {ATSPI_ROLE_PAGE_TAB_LIST, "ControlType.Tab"},
        {ATSPI_ROLE_PANEL, "ControlType.Pane"},
        {ATSPI_ROLE_PARAGRAPH, "ControlType.Text"},
        {ATSPI_ROLE_PASSWORD_TEXT, "ControlType.Edit"},
        {ATSPI_ROLE_POPUP_MENU, "ControlType.Menu"},
        {ATSPI_ROLE_PROGRESS_BAR, "ControlType.ProgressBar"},
        {ATSPI_ROLE_PUSH_BUTTON, "ControlType.Button"},
        {ATSPI_ROLE_RADIO_BUTTON, "ControlType.RadioButton"},
        {ATSPI_ROLE_RADIO_MENU_ITEM, "ControlType.MenuItem"},
        {ATSPI_ROLE_ROW_HEADER, "ControlType.HeaderItem"},
        {ATSPI_ROLE_SCROLL_BAR, "ControlType.ScrollBar"},
        {ATSPI_ROLE_SCROLL_PANE, "ControlType.Pane"},
        {ATSPI_ROLE_SEPARATOR, "ControlType.Separator"},
        {ATSPI_ROLE_SLIDER, "ControlType.Slider"},
        {ATSPI_ROLE_SPIN_BUTTON, "ControlType.Spinner"},
        {ATSPI_ROLE_SPLIT_PANE, "ControlType.Pane"},
        {ATSPI_ROLE_STATUS_BAR, "ControlType.StatusBar"},
        {ATSPI_ROLE_TABLE, "ControlType.Table"},
        {ATSPI_ROLE_TABLE_CELL, "ControlType.DataItem"},
        {ATSPI_ROLE_TEXT, "ControlType.Edit"},
        {ATSPI_ROLE_TITLE_BAR, "ControlType.TitleBar"},
        {ATSPI_ROLE_TOGGLE_BUTTON, "ControlType.Button"},
        {ATSPI_ROLE_TOOL_BAR, "ControlType.ToolBar"},
        {ATSPI_ROLE_TOOL_TIP, "ControlType.ToolTip"},
        {ATSPI_ROLE_TREE, "ControlType.Tree"},
        {ATSPI_ROLE_TREE_ITEM, "ControlType.TreeItem"},
    }};
    return a;
}

std::string to_control_type(AtspiRole role)
{
    return lookup(get_control_types(), role, CONTROL_TYPE_CUSTOM);
}

std::string to_string(AtspiRole role)
{
    GStrPtr name{atspi_role_get_name(role), g_free};
    if (name)
        return name.get();
    return sstr() << "role " << static_cast<int>(role);
}

PropertyError to_property_error(const GError* error)
{
    if (!error)
        return PropertyError::NONE;

    std::string msg = safe_assign(error->message);
    if (contains(msg, "AccessDenied"))
        return PropertyError::ACCESS_DENIED;
    if (contains(msg, "no longer exists") ||    // application gone
        contains(msg, "UnknownObject") ||
        contains(msg, "ServiceUnknown") ||
        contains(msg, "UnknownMethod"))
        return PropertyError::STALE_ELEMENT;

    return PropertyError::PROPERTY_UNAVAILABLE;
}

std::string to_structure_change_kind(const std::string& event_type)
{
    auto fields = split(event_type, ':');
    if (fields.size() >= 3)
    {
        if (fields[2] == "add")
            return STRUCTURE_CHILD_ADDED;
        if (fields[2] == "remove")
            return STRUCTURE_CHILD_REMOVED;
    }
    return STRUCTURE_CHILDREN_INVALIDATED;
}


// Element backed by a live AT-SPI accessible. Successful reads are
// cached, the element is queried from a single callback only.
class AtspiElement : public UIElement
{
    public:
        using Super = UIElement;
        struct State
        {
            Noneable<std::string> name;
            Noneable<AtspiRole> role;
            Noneable<guint> pid;
            Noneable<std::string> toolkit_name;
        };

    private:
        AtspiAccessiblePtr m_accessible;
        mutable State m_state;

    public:
        AtspiElement(const ContextBase& context, AtspiAccessiblePtr accessible) :
            Super(context),
            m_accessible(accessible)
        {}

        static UIElementPtr make(const ContextBase& context, AtspiAccessible* accessible)
        {
            g_object_ref(accessible);
            return std::make_shared<AtspiElement>(context,
                AtspiAccessiblePtr{accessible, g_object_unref});
        }

        virtual std::ostream& dump(std::ostream& s) const override
        {
            s << "AtspiElement(name=" << get_name()
              << " control_type=" << get_control_type()
              << " pid=" << get_process_id() << ")";
            return s;
        }

        // Logs and frees error.
        PropertyError check_ok(GError*& error, const char* func_name) const
        {
            PropertyError result = PropertyError::NONE;
            if (error)
            {
                result = to_property_error(error);
                LOG_ATSPI << func_name
                          << ": " << g_quark_to_string(error->domain) << ": " << error->message
                          << " (" << error->code << ") -> " << result;
                g_error_free(error);
                error = nullptr;
            }
            return result;
        }

        template<typename T, typename F>
        PropertyResult<T> cached_get(Noneable<T>& state_value,
                                     const F& func, const char* func_name) const
        {
            if (state_value.is_none())
            {
                if (!m_accessible)
                    return PropertyError::STALE_ELEMENT;

                GError *error = nullptr;
                auto value = func(m_accessible.get(), &error);
                PropertyError e = check_ok(error, func_name);
                if constexpr(std::is_pointer_v<decltype(value)>)
                {
                    GStrPtr p{value, g_free};
                    if (e != PropertyError::NONE)
                        return e;
                    state_value = safe_assign(p.get());
                }
                else
                {
                    if (e != PropertyError::NONE)
                        return e;
                    state_value = value;
                }
            }
            return state_value.value;
        }

        // ////// Cached, exception-safe accessor functions //////

        virtual PropertyResult<std::string> get_name() const override
        {
            return CACHED_GET(m_state.name, atspi_accessible_get_name);
        }

        PropertyResult<AtspiRole> get_role() const
        {
            return CACHED_GET(m_state.role, atspi_accessible_get_role);
        }

        virtual PropertyResult<std::string> get_control_type() const override
        {
            auto role = get_role();
            if (!role)
                return role.error();
            if (role.value() == ATSPI_ROLE_INVALID)
                return PropertyError::PROPERTY_UNAVAILABLE;
            return to_control_type(role.value());
        }

        virtual PropertyResult<std::string> get_class_name() const override
        {
            if (!m_accessible)
                return PropertyError::STALE_ELEMENT;

            GError* error = nullptr;
            GHashTablePtr table = {atspi_accessible_get_attributes(m_accessible.get(), &error),
                                   g_hash_table_destroy};
            PropertyError e = check_ok(error, "atspi_accessible_get_attributes");
            if (e == PropertyError::STALE_ELEMENT)
                return e;
            if (e == PropertyError::NONE && table)
            {
                auto value = static_cast<const gchar*>(g_hash_table_lookup(table.get(), "class"));
                if (value && value[0])
                    return std::string(value);
            }

            return CACHED_GET(m_state.toolkit_name, atspi_accessible_get_toolkit_name);
        }

        virtual PropertyResult<int32_t> get_process_id() const override
        {
            auto pid = CACHED_GET(m_state.pid, atspi_accessible_get_process_id);
            if (!pid)
                return pid.error();
            if (pid.value() == 0)
                return PropertyError::PROPERTY_UNAVAILABLE;
            return static_cast<int32_t>(pid.value());
        }

        virtual PropertyResult<BoundingBox> get_bounding_box() const override
        {
            if (!m_accessible)
                return PropertyError::STALE_ELEMENT;

            AtspiIFaceComponentPtr component =
                {atspi_accessible_get_component_iface(m_accessible.get()),
                 g_object_unref};
            if (!component)
                return PropertyError::PROPERTY_UNAVAILABLE;

            GError* error = nullptr;
            AtspiRectPtr r = {atspi_component_get_extents(component.get(),
                                                          ATSPI_COORD_TYPE_SCREEN, &error),
                              g_free};
            PropertyError e = check_ok(error, "atspi_component_get_extents");
            if (e != PropertyError::NONE)
                return e;
            if (!r)
                return PropertyError::PROPERTY_UNAVAILABLE;

            return BoundingBox{r->x, r->y, r->x + r->width, r->y + r->height};
        }

        virtual PropertyResult<UIElementPtr> get_parent() const override
        {
            if (!m_accessible)
                return PropertyError::STALE_ELEMENT;

            GError* error = nullptr;
            AtspiAccessiblePtr parent =
                {atspi_accessible_get_parent(m_accessible.get(), &error),
                 g_object_unref};
            PropertyError e = check_ok(error, "atspi_accessible_get_parent");
            if (e != PropertyError::NONE)
                return e;
            if (!parent)
                return UIElementPtr();
            return UIElementPtr(std::make_shared<AtspiElement>(*this, parent));
        }
};


// Delivers AT-SPI events of the whole desktop from a private
// main loop thread.
class AtspiEventSource : public AccessibilityEventSource
{
    public:
        using Super = AccessibilityEventSource;

        struct Registration
        {
            const char* event;
            AccessibilityEventCategory category;
            AtspiEventSource* source;
            AtspiListenerPtr listener;
        };

        AtspiEventSource(const ContextBase& context);
        virtual ~AtspiEventSource();

        virtual void subscribe(AccessibilityEventSink* sink) override;
        virtual void unsubscribe() override;
        virtual bool is_subscribed() const override
        {
            return m_sink != nullptr;
        }

    private:
        void atspi_connect(Registration& r);
        void atspi_disconnect(Registration& r);
        void throw_on_error(GError* error, const std::string& func_name) const;
        bool check_ok(GError*& error, const std::string& func_name) const;

        void on_atspi_event(AtspiEvent* event, AccessibilityEventCategory category);

    private:
        std::array<Registration, 5> m_registrations;
        AccessibilityEventSink* m_sink{};
        GMainLoop* m_main_loop{};
        std::thread m_thread;
        std::mutex m_mutex;
};

std::unique_ptr<AccessibilityEventSource> AccessibilityEventSource::make_atspi(const ContextBase& context)
{
    return std::make_unique<AtspiEventSource>(context);
}

AtspiEventSource::AtspiEventSource(const ContextBase& context) :
    Super(context),
    m_registrations
    {{
        {"object:state-changed:focused", AccessibilityEventCategory::FOCUS_CHANGED, this, {}},
        {"object:state-changed:pressed", AccessibilityEventCategory::ELEMENT_INVOKED, this, {}},
        {"object:children-changed", AccessibilityEventCategory::STRUCTURE_CHANGED, this, {}},
        {"object:property-change:accessible-name", AccessibilityEventCategory::PROPERTY_CHANGED, this, {}},
        {"object:state-changed:showing", AccessibilityEventCategory::PROPERTY_CHANGED, this, {}},
    }}
{
}

AtspiEventSource::~AtspiEventSource()
{
    unsubscribe();
}

void AtspiEventSource::subscribe(AccessibilityEventSink* sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_sink)
        return;

    int result = atspi_init();
    if (result > 1)
        throw AtspiException(sstr() << "atspi_init failed (" << result << "), "
                             << "is the accessibility bus running?");

    m_sink = sink;
    try
    {
        for (auto& r : m_registrations)
            atspi_connect(r);
    }
    catch (const AtspiException&)
    {
        for (auto& r : m_registrations)
            atspi_disconnect(r);
        m_sink = nullptr;
        throw;
    }

    // AT-SPI dispatches from the default main context
    m_main_loop = g_main_loop_new(nullptr, FALSE);
    m_thread = std::thread([this]
    {
        g_main_loop_run(m_main_loop);
    });

    LOG_DEBUG << "listening to " << m_registrations.size() << " AT-SPI events";
}

void AtspiEventSource::unsubscribe()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_sink)
        return;

    // Stop callbacks before the listeners go away. Quit from an idle
    // handler, a plain g_main_loop_quit() is lost if the loop
    // hasn't started running yet.
    if (m_main_loop)
    {
        g_idle_add([](gpointer user_data) -> gboolean
                   {
                       g_main_loop_quit(static_cast<GMainLoop*>(user_data));
                       return G_SOURCE_REMOVE;
                   },
                   m_main_loop);
        if (m_thread.joinable())
            m_thread.join();
        g_main_loop_unref(m_main_loop);
        m_main_loop = nullptr;
    }

    for (auto& r : m_registrations)
        atspi_disconnect(r);
    m_sink = nullptr;

    LOG_DEBUG << "AT-SPI listeners deregistered";
}

// Start listening to an AT-SPI event.
// Creates a new event listener for each event, since this seems
// to be the only way to allow reliable deregistering of events.
void AtspiEventSource::atspi_connect(Registration& r)
{
    if (!r.listener)
    {
        GError* error = nullptr;

        r.listener = {atspi_event_listener_new(
                          [](AtspiEvent* event, void* user_data)
                          {
                              auto reg = static_cast<Registration*>(user_data);
                              reg->source->on_atspi_event(event, reg->category);
                          },
                          &r, NULL),
                      g_object_unref};
        if (!r.listener)
            throw AtspiException(sstr() << "atspi_event_listener_new failed for " << r.event);

        atspi_event_listener_register(r.listener.get(), r.event, &error);
        throw_on_error(error, std::string("atspi_event_listener_register (") + r.event + ")");
    }
}

void AtspiEventSource::atspi_disconnect(Registration& r)
{
    if (r.listener)
    {
        GError *error = nullptr;

        atspi_event_listener_deregister(r.listener.get(), r.event, &error);
        check_ok(error, std::string("atspi_event_listener_deregister (") + r.event + ")");

        r.listener = nullptr;
    }
}

void AtspiEventSource::throw_on_error(GError* error, const std::string& func_name) const
{
    if (error)
    {
        std::string msg = sstr()
            << func_name
            << ": " << g_quark_to_string(error->domain) << ": " << error->message
            << " (" << error->code << ")";
        g_error_free(error);
        throw AtspiException(msg);
    }
}

bool AtspiEventSource::check_ok(GError*& error, const std::string& func_name) const
{
    if (error)
    {
        LOG_ATSPI << func_name
                  << ": " << g_quark_to_string(error->domain) << ": " << error->message
                  << " (" << error->code << ")";
        g_error_free(error);
        error = nullptr;
        return false;
    }
    return true;
}

void AtspiEventSource::on_atspi_event(AtspiEvent* event_, AccessibilityEventCategory category)
{
    AtspiEventPtr event{event_, free_atspi_event};
    if (!event || !event->source || !m_sink)
        return;

    std::string type = safe_assign(event->type);
    LOG_EVENT << type << " detail1=" << event->detail1 << " detail2=" << event->detail2;

    AccessibilityEvent e;
    e.category = category;
    switch (category)
    {
        case AccessibilityEventCategory::FOCUS_CHANGED:
        case AccessibilityEventCategory::ELEMENT_INVOKED:
            if (event->detail1 != 1)
                return;    // focus lost, button released
            break;

        case AccessibilityEventCategory::STRUCTURE_CHANGED:
            e.structure_change_kind = to_structure_change_kind(type);
            break;

        case AccessibilityEventCategory::PROPERTY_CHANGED:
            if (startswith(type, "object:state-changed:showing"))
            {
                e.property_name = IS_OFFSCREEN_PROPERTY;
                e.new_value = event->detail1 == 0;
            }
            else
            {
                e.property_name = NAME_PROPERTY;
                if (G_VALUE_HOLDS_STRING(&event->any_data))
                    e.new_value = safe_assign(g_value_get_string(&event->any_data));
                else
                    e.new_value = nullptr;
            }
            break;
    }

    e.element = AtspiElement::make(*this, event->source);

    try
    {
        m_sink->on_accessibility_event(e);
    }
    catch (const std::exception& ex)
    {
        LOG_ERROR << "[" << to_string(category) << "] " << type << ": " << ex.what();
    }
}
