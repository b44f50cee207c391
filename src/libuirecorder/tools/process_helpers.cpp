
#include <string>
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;

#include "tools/file_helpers.h"
#include "tools/path_helpers.h"
#include "tools/string_helpers.h"

#include "../exception.h"
#include "process_helpers.h"


std::vector<std::string> Process::get_cmdline(int pid)
{
    std::string cmdline;
    std::string error;
    auto path = fs::path("/proc") / std::to_string(pid) / "cmdline";
    if (!read_file(cmdline, path, 0, error))
        throw ProcessException(sstr()
            << "failed to read " << path << ": " << error);
    return split(cmdline, '\0');
}

std::string Process::get_process_name(int pid)
{
    if (pid <= 0)
        throw ProcessException(sstr() << "invalid pid " << pid);

    auto cmdline = Process::get_cmdline(pid);
    if (!cmdline.empty() && !cmdline[0].empty())
        return get_filename(cmdline[0]);

    // kernel threads and zombies have an empty cmdline
    std::string comm;
    auto path = fs::path("/proc") / std::to_string(pid) / "comm";
    if (read_file(comm, path))
        return strip(comm);
    throw ProcessException(sstr() << "no name for pid " << pid);
}
