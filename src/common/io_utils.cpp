#include "common/io_utils.hpp"
#include <errno.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string() + " for writing");
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

int count_entries_in_directory(const fs::path &dir) {
    if (!fs::is_directory(dir))
        return -1;
    return (int)distance(fs::directory_iterator(dir), fs::directory_iterator());
}

}  // namespace sandbox
