#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path, ios::in | ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
    fout << content;
}

string assert_safe_path(const string &subpath) {
    for (auto &part : fs::path(subpath))
        if (part == "..")
            throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

string assert_safe_file_name(const string &name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != string::npos || name.find('\0') != string::npos)
        throw invalid_argument("file name is not safe " + name);
    return name;
}

}  // namespace arbiter
