#pragma once

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>

namespace cpjudge {

/**
 * @brief 由用户输入一个新的测试点
 * 依次读入输入数据和标准答案，写入编号为 next_test_case_id(file) 的 P.in 和 P.ans 文件。
 * @param file 代码文件路径
 * @param read_block 读入一段内容，每次调用读到输入结束为止
 * @param out 提示信息的输出流
 * @return 新测试点的编号
 * @throw std::system_error 测试点文件写入失败，此时不会留下只有输入数据的测试点
 */
int record(const std::filesystem::path &file, const std::function<std::string()> &read_block, std::ostream &out);

/**
 * @brief 从标准输入读入一个新的测试点，每一段内容以 Ctrl+D 结束
 */
int record(const std::filesystem::path &file);

}  // namespace cpjudge
