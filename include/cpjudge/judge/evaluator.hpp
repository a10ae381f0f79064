#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "cpjudge/common/verdict.hpp"
#include "cpjudge/judge/report.hpp"

namespace cpjudge {

/**
 * @brief 选手输出与标准答案的比较结果
 */
struct comparison {
    /**
     * @brief ACCEPTED 或 WRONG_ANSWER
     */
    verdict result;

    /**
     * @brief 输出与标准答案不完全一致，但逐行去掉首尾空白字符后一致
     */
    bool whitespace_differs = false;

    /**
     * @brief 按 '\n' 切分并去掉首尾空白字符后的每一行
     */
    std::vector<std::string> output_lines;
    std::vector<std::string> answer_lines;
};

/**
 * @brief 按 '\n' 切分文本，末尾的换行符会产生一个空行
 */
std::vector<std::string> split_lines(const std::string &text);

/**
 * @brief 比较选手输出和标准答案
 * 1. 两者完全一致（包括所有空白字符）时为 AC
 * 2. 否则逐行去掉首尾空白字符，行数相同且每一行都一致时为 AC，并标记 whitespace_differs
 * 3. 其余情况为 WA
 */
comparison compare_output(const std::string &output, const std::string &answer);

/**
 * @brief 生成逐行对比表格
 * 第 i 行只与第 i 行比较，不计算编辑距离，因此多输出或者少输出一行会导致之后的行全部不一致。
 * 栏宽为选手输出最长行的长度，但不小于 MIN_COLUMN_WIDTH，不大于 terminal_width - 8。
 * @return 行数为 max(output_lines.size(), answer_lines.size()) 的表格
 */
diff_table make_diff_table(const std::vector<std::string> &output_lines,
                           const std::vector<std::string> &answer_lines,
                           int terminal_width);

/**
 * @brief 评测程序正常运行后的输出，并输出评测结果
 * 只应在程序正常退出且没有超时的情况下调用。
 * 若输出文件或标准答案文件不存在，返回 RUNTIME_ERROR。
 * @param id 测试点编号，用于展示
 * @param out 评测结果的输出流
 */
verdict evaluate(const std::filesystem::path &output_path, const std::filesystem::path &answer_path,
                 int id, std::ostream &out);

}  // namespace cpjudge
