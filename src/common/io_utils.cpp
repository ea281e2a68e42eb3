#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include "common/exceptions.hpp"

namespace funcjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::trunc | ios::binary);
    if (!fout)
        throw internal_error("unable to open file " + path.string() + " for writing");
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout)
        throw internal_error("unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw internal_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace funcjudge
