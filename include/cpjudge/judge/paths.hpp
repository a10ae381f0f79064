#pragma once

#include <filesystem>
#include <vector>

/**
 * 测试数据与代码文件放在同一个文件夹中，以代码文件 P.ext 为例：
 * P.in1   // 第 1 个测试点的输入数据
 * P.ans1  // 第 1 个测试点的标准答案
 * P.out1  // 第 1 个测试点最近一次正常运行的输出
 * P       // 编译得到的可执行文件
 * P.debug // 调试模式编译得到的可执行文件
 * 测试点编号不补零。
 */
namespace cpjudge {

std::filesystem::path input_path(const std::filesystem::path &file, int id);

std::filesystem::path output_path(const std::filesystem::path &file, int id);

std::filesystem::path answer_path(const std::filesystem::path &file, int id);

/**
 * @brief 需要编译的语言编译出的可执行文件路径
 * @param debug 是否为调试模式编译出的可执行文件
 */
std::filesystem::path compiled_path(const std::filesystem::path &file, bool debug);

/**
 * @brief 查找代码文件的所有测试点编号
 * 只接受文件名恰好为 P.in 加上十进制编号的输入文件，编号不能为 0，不能有前导零，
 * 这样每个编号都只对应一个输入文件。
 * @return 升序排列的测试点编号
 */
std::vector<int> list_test_case_ids(const std::filesystem::path &file);

/**
 * @brief 新建测试点时使用的编号，即已有最大编号加一，没有测试点时为 1
 * @throw std::overflow_error 已有最大编号为 INT_MAX
 */
int next_test_case_id(const std::filesystem::path &file);

}  // namespace cpjudge
