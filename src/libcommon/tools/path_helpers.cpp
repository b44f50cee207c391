#include <string>
#include <system_error>
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;

#include "path_helpers.h"


std::string get_filename(const std::string& fn)
{
    return fs::path(fn).filename();
}

std::string get_executable_dir()
{
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec)
        return {};
    return exe.parent_path();
}
