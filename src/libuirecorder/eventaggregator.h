#ifndef EVENTAGGREGATOR_H
#define EVENTAGGREGATOR_H

#include <mutex>
#include <vector>

#include "uievents.h"


// Append-only, thread-safe list of records. Records are never
// removed, so an earlier snapshot is always a prefix of a later one.
template <class T>
class EventBuffer
{
    public:
        void append(const T& item)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_items.emplace_back(item);
        }

        // Append only if predicate(existing items, item) agrees,
        // checked and appended under the same lock.
        template <class F>
        bool append_if(const T& item, const F& predicate)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!predicate(m_items, item))
                return false;
            m_items.emplace_back(item);
            return true;
        }

        std::vector<T> snapshot() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items;
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items.size();
        }

    private:
        mutable std::mutex m_mutex;
        std::vector<T> m_items;
};


// The three in-memory session logs, filled concurrently by the
// AT-SPI callback thread and the pollers.
class EventAggregator
{
    public:
        EventBuffer<UIEvent>& get_ui_events() {return m_ui_events;}
        const EventBuffer<UIEvent>& get_ui_events() const {return m_ui_events;}

        EventBuffer<PointerClickEvent>& get_pointer_clicks() {return m_pointer_clicks;}
        const EventBuffer<PointerClickEvent>& get_pointer_clicks() const {return m_pointer_clicks;}

        EventBuffer<BrowserUrlEvent>& get_browser_urls() {return m_browser_urls;}
        const EventBuffer<BrowserUrlEvent>& get_browser_urls() const {return m_browser_urls;}

        // Append unless the URL equals the most recently recorded one.
        bool append_browser_url_if_changed(const BrowserUrlEvent& e)
        {
            return m_browser_urls.append_if(e,
                [](const std::vector<BrowserUrlEvent>& items, const BrowserUrlEvent& item)
                {
                    return items.empty() || items.back().url != item.url;
                });
        }

    private:
        EventBuffer<UIEvent> m_ui_events;
        EventBuffer<PointerClickEvent> m_pointer_clicks;
        EventBuffer<BrowserUrlEvent> m_browser_urls;
};

#endif // EVENTAGGREGATOR_H
