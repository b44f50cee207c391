#ifndef FILE_HELPERS_H
#define FILE_HELPERS_H

#include <string>

bool is_file(const std::string& fn);

bool read_file(std::string& result,
               const std::string& fn,
               size_t max_characters=0);
bool read_file(std::string& result,
               const std::string& fn,
               size_t max_characters,
               std::string& error);

// Write to a temporary file next to fn, then rename it over fn.
// Readers see either the old or the new content, never a partial file.
bool replace_file_contents(const std::string& fn,
                           const std::string& contents,
                           std::string& error);

class TempDir
{
    public:
        TempDir(const std::string& prefix="tmpdir_");
        ~TempDir();

    public:
        std::string dir;
};

#endif // FILE_HELPERS_H
