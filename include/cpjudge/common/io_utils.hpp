#pragma once

#include <filesystem>
#include <istream>
#include <string>

namespace cpjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖文件原有的内容
 * @throw std::system_error 若文件无法打开或者写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 从流中读取直到 EOF，之后清除流的 EOF 状态
 * 清除 EOF 状态是为了让终端在用户按下 Ctrl+D 之后还能继续读入下一段内容
 */
std::string read_to_eof(std::istream &in);

}  // namespace cpjudge
