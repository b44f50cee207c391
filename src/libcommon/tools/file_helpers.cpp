#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;

#include "string.h"   // strerror

#include "tools/string_helpers.h"

#include "file_helpers.h"

bool is_file(const std::string& fn)
{
    std::error_code ec;
    return fs::is_regular_file(fn, ec);
}

bool read_file(std::string& result,
               const std::string& fn,
               size_t max_characters)
{
    std::string error;
    return read_file(result, fn, max_characters, error);
}

bool read_file(std::string& result,
               const std::string& fn,
               size_t max_characters,
               std::string& error)
{
    std::ifstream ifs(fn);
    if (!ifs.good())
    {
        error = strerror(errno);
        return false;
    }

    if (max_characters == 0)
    {
        // read whole file
        std::stringstream ss;
        ss << ifs.rdbuf();
        result = ss.str();
    }
    else
    {
        // read first n characters
        result.resize(max_characters);
        ifs.read(&result[0], static_cast<std::streamsize>(max_characters));
        result.resize(static_cast<size_t>(ifs.gcount()));
    }
    return true;
}

bool replace_file_contents(const std::string& fn,
                           const std::string& contents,
                           std::string& error)
{
    std::string tmp_fn = fn + ".tmp";
    {
        std::ofstream ofs(tmp_fn, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!ofs.good())
        {
            error = sstr() << "failed to open " << repr(tmp_fn) << ": " << strerror(errno);
            return false;
        }

        ofs << contents;
        ofs.flush();
        if (!ofs.good())
        {
            error = sstr() << "failed to write " << repr(tmp_fn) << ": " << strerror(errno);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_fn, fn, ec);
    if (ec)
    {
        error = sstr() << "failed to rename " << repr(tmp_fn)
                       << " to " << repr(fn) << ": " << ec.message();
        fs::remove(tmp_fn, ec);
        return false;
    }
    return true;
}


TempDir::TempDir(const std::string& prefix)
{
    this->dir = fs::temp_directory_path() / (prefix + "XXXXXXXXXX");
    if (mkdtemp(&this->dir[0]) == nullptr)
        throw std::runtime_error("mkdtemp failed");
}

TempDir::~TempDir()
{
    std::error_code ec;
    if (!this->dir.empty() && fs::is_directory(this->dir, ec))
        fs::remove_all(this->dir, ec);
}
