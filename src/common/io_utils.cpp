#include "common/io_utils.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, size_t limit, bool &truncated) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    truncated = fin.peek() != char_traits<char>::eof();
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.front() == '/')
        throw invalid_argument("subpath is not safe " + subpath);
    for (auto &part : fs::path(subpath))
        if (part == "..")
            throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

time_t last_write_time(const fs::path &path) {
    struct stat attr;
    if (stat(path.c_str(), &attr) != 0)
        throw system_error(errno, system_category(), "error when reading modification time of path " + path.string());
    return attr.st_mtim.tv_sec;
}

}  // namespace grader
