#include "common/io_utils.hpp"

#include <algorithm>
#include <fstream>

#include "common/exceptions.hpp"

namespace grader {
using namespace std;

const char *const TRUNCATED_MARKER = "<...truncated>";

string read_file_content(const filesystem::path &path, long max_bytes) {
    ifstream fin(path.string(), ios::in | ios::binary | ios::ate);
    if (!fin) BOOST_THROW_EXCEPTION(grader_exception() << "unable to open file " << path);

    auto file_size = fin.tellg();
    fin.seekg(0, ios::beg);

    auto read_size = max_bytes > 0 ? min(file_size, ifstream::pos_type(max_bytes)) : file_size;

    string result;
    result.resize(read_size);
    fin.read(&result[0], read_size);

    if (read_size < file_size) result += TRUNCATED_MARKER;
    return result;
}

string read_file_content(const filesystem::path &path, const string &def, long max_bytes) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path, max_bytes);
    }
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        BOOST_THROW_EXCEPTION(invalid_job() << "subpath is not safe " << subpath);
    return subpath;
}

}  // namespace grader
