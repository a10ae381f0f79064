#include "cpjudge/judge/evaluator.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include "cpjudge/common/io_utils.hpp"
#include "cpjudge/config.hpp"

namespace cpjudge {
using namespace std;
namespace fs = std::filesystem;

vector<string> split_lines(const string &text) {
    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    return lines;
}

static vector<string> trim_lines(const vector<string> &lines) {
    vector<string> result;
    for (auto &line : lines)
        result.push_back(boost::algorithm::trim_copy(line));
    return result;
}

comparison compare_output(const string &output, const string &answer) {
    comparison result;
    result.output_lines = trim_lines(split_lines(output));
    result.answer_lines = trim_lines(split_lines(answer));

    if (output == answer) {
        result.result = verdict::ACCEPTED;
    } else if (result.output_lines == result.answer_lines) {
        result.result = verdict::ACCEPTED;
        result.whitespace_differs = true;
    } else {
        result.result = verdict::WRONG_ANSWER;
    }
    return result;
}

diff_table make_diff_table(const vector<string> &output_lines,
                           const vector<string> &answer_lines,
                           int terminal_width) {
    size_t max_output_width = 0;
    for (auto &line : output_lines)
        max_output_width = max(max_output_width, line.size());

    int width = min(max((int)max_output_width, MIN_COLUMN_WIDTH), terminal_width - 8);

    diff_table table;
    table.column_width = (size_t)max(width, 1);

    size_t rows = max(output_lines.size(), answer_lines.size());
    for (size_t i = 0; i < rows; ++i) {
        diff_row row;
        row.left = i < output_lines.size() ? output_lines[i] : "";
        row.right = i < answer_lines.size() ? answer_lines[i] : "";
        row.matches = i < output_lines.size() && i < answer_lines.size() && output_lines[i] == answer_lines[i];
        table.rows.push_back(row);
    }
    return table;
}

verdict evaluate(const fs::path &output_path, const fs::path &answer_path, int id, ostream &out) {
    // 缺少文件时沿用 RTE，与程序运行出错共用同一个评测结果
    if (!fs::exists(output_path)) {
        out << "output file not found in " << output_path.string() << endl;
        LOG(WARNING) << "Output file " << output_path << " not found";
        return verdict::RUNTIME_ERROR;
    }
    if (!fs::exists(answer_path)) {
        out << "answer file not found in " << answer_path.string() << endl;
        LOG(WARNING) << "Answer file " << answer_path << " not found";
        return verdict::RUNTIME_ERROR;
    }

    string output = read_file_content(output_path);
    string answer = read_file_content(answer_path);
    comparison result = compare_output(output, answer);

    print_verdict(out, id, result.result);
    if (result.result == verdict::ACCEPTED) {
        if (result.whitespace_differs)
            print_whitespace_advisory(out);
        print_output_block(out, "Your Output", output);
    } else {
        print_diff_table(out, make_diff_table(result.output_lines, result.answer_lines, terminal_width()));
    }
    return result.result;
}

}  // namespace cpjudge
