#include "cpjudge/judge/recorder.hpp"
#include <glog/logging.h>
#include <iostream>
#include <system_error>
#include "cpjudge/common/io_utils.hpp"
#include "cpjudge/judge/paths.hpp"

namespace cpjudge {
using namespace std;
namespace fs = std::filesystem;

int record(const fs::path &file, const function<string()> &read_block, ostream &out) {
    int id = next_test_case_id(file);

    out << endl
        << "Press ctrl+D to finish your input" << endl
        << endl
        << "Test Case Input:" << endl
        << endl;
    string input = read_block();

    out << endl
        << "Test Case Correct Output:" << endl
        << endl;
    string answer = read_block();

    fs::path input_file = input_path(file, id);
    write_file_content(input_file, input);
    try {
        write_file_content(answer_path(file, id), answer);
    } catch (system_error &) {
        // 只有输入数据的测试点会被评测为 RTE，因此一起删除
        error_code ec;
        fs::remove(input_file, ec);
        throw;
    }
    LOG(INFO) << "Test case " << id << " of " << file << " written";

    out << endl
        << "Test case " << id << " written." << endl;
    return id;
}

int record(const fs::path &file) {
    return record(
        file, [] { return read_to_eof(cin); }, cout);
}

}  // namespace cpjudge
