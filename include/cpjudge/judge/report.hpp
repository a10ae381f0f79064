#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "cpjudge/common/verdict.hpp"

/**
 * 评测结果的终端展示。
 * 只有 USE_COLOR 为真时才会输出颜色控制字符，颜色不影响对齐。
 */
namespace cpjudge {

/**
 * @brief 输出与标准答案对比表格中的一行
 */
struct diff_row {
    std::string left;   // 选手输出的第 i 行，没有则为空
    std::string right;  // 标准答案的第 i 行，没有则为空
    bool matches;       // 两边都存在第 i 行且相同
};

struct diff_table {
    size_t column_width;
    std::vector<diff_row> rows;
};

/**
 * @brief 一次评测所有测试点的得分
 */
struct score {
    int accepted = 0;
    int total = 0;
};

/**
 * @brief 当前终端的宽度
 * 依次尝试 TIOCGWINSZ、环境变量 COLUMNS，都不可用时返回 80
 */
int terminal_width();

/**
 * @brief 将 text 居中，两侧用空格填充到 width 宽，text 比 width 长时原样返回
 */
std::string pad_center(const std::string &text, size_t width);

/**
 * @brief 输出 "Test Case {id}: " 和评测结果的标签
 */
void print_verdict(std::ostream &out, int id, verdict v);

void print_whitespace_advisory(std::ostream &out);

/**
 * @brief 输出一段带标题的程序输出，比如 AC 时的 "Your Output"
 */
void print_output_block(std::ostream &out, const std::string &title, const std::string &text);

/**
 * @brief 输出对比表格，左栏为选手输出，右栏为标准答案，行末的标记表示该行是否一致
 */
void print_diff_table(std::ostream &out, const diff_table &table);

/**
 * @brief 输出 "Summary: | N / M AC |"，全部通过时附加庆祝标记
 */
void print_score(std::ostream &out, const score &s);

void print_compilation_error(std::ostream &out);

}  // namespace cpjudge
