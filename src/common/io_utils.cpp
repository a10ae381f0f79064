#include "cpjudge/common/io_utils.hpp"
#include <errno.h>
#include <fstream>
#include <iterator>
#include <system_error>

namespace cpjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string() + " for writing");
    fout << content;
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string read_to_eof(istream &in) {
    string str((istreambuf_iterator<char>(in)),
               (istreambuf_iterator<char>()));
    in.clear();
    return str;
}

}  // namespace cpjudge
