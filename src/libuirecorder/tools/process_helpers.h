#ifndef PROCESS_HELPERS_H
#define PROCESS_HELPERS_H

#include <string>
#include <vector>


class Process
{
    public:
        // Returns the command line for process id pid
        static std::vector<std::string> get_cmdline(int pid);

        // Executable name of process pid, without directory.
        // throws ProcessException if the process can't be inspected
        static std::string get_process_name(int pid);
};

#endif // PROCESS_HELPERS_H
