#ifndef PROCESSFILTER_H
#define PROCESSFILTER_H

#include <atomic>
#include <cstdint>
#include <ostream>

#include "tools/propertyresult.h"

#include "uirecorderglobals.h"


struct ProcessFilterState
{
    bool enabled{false};
    int32_t pid{0};
};

std::ostream& operator<<(std::ostream& s, const ProcessFilterState& state);


// Gate that optionally restricts recording to a single process,
// the owner of the foreground window at the time it was enabled.
class ProcessFilter : public ContextBase
{
    public:
        ProcessFilter(const ContextBase& context);

        // Flip between Unfiltered and Foreground-Only. Entering
        // Foreground-Only resolves the foreground window's process,
        // on failure the filter stays Unfiltered.
        ProcessFilterState toggle();

        // Foreground-Only for pid, or Unfiltered for pid <= 0.
        void set_pid(int32_t pid);

        ProcessFilterState get_state() const;

        // Unfiltered: everything passes. Foreground-Only: only
        // events whose pid could be read and matches.
        bool passes(const PropertyResult<int32_t>& pid) const;

    private:
        // Written by the control thread only, read from AT-SPI callbacks.
        std::atomic<int32_t> m_pid{0};
};

#endif // PROCESSFILTER_H
