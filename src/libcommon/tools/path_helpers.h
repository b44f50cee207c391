#ifndef PATH_HELPERS_H
#define PATH_HELPERS_H

#include <string>

std::string get_filename(const std::string& fn);

// Directory of the running binary, empty if /proc/self/exe can't be read.
std::string get_executable_dir();

#endif // PATH_HELPERS_H
