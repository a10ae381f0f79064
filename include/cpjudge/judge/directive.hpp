#pragma once

#include <filesystem>
#include <string>
#include "cpjudge/language.hpp"

namespace cpjudge {

/**
 * @brief 从代码中提取时间限制指令
 * 指令单独占一行，比如 C++ 代码中的 "// time-limit: 1000"。
 * 只有第一条匹配的指令有效，每个代码文件只有一个时间限制。
 * @param source_text 代码文件的内容
 * @param comment_marker 单行注释前缀，按字面匹配
 * @return 时间限制（毫秒），没有指令时返回 DEFAULT_TIME_LIMIT
 */
int extract_time_limit(const std::string &source_text, const std::string &comment_marker);

int extract_time_limit(const std::filesystem::path &file, language lang);

}  // namespace cpjudge
