#ifndef UIRECORDER_H
#define UIRECORDER_H

#include <memory>

class Logger;

// The main class
class UIRecorder
{
    public:
        virtual ~UIRecorder() = default;

        // Subscribe to accessibility events, start the pollers and
        // the control input on stdin.
        // throws AtspiException if the accessibility subsystem is unusable
        virtual void startup() = 0;

        // Flip the process filter between all processes and the
        // foreground process.
        virtual void toggle_filter() = 0;

        // Stop all event sources, then persist. Safe to call repeatedly.
        // Returns false if any log couldn't be written.
        virtual bool shutdown() = 0;

        // Write the session logs. Safe to call repeatedly.
        virtual bool persist() = 0;

        // The configured logger after startup(), the default one before.
        virtual Logger* get_logger() = 0;

    public:
        static std::unique_ptr<UIRecorder> make();
};

#endif // UIRECORDER_H
