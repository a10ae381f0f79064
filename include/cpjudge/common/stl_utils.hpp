#pragma once

#include <string>

namespace cpjudge {

template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

/**
 * @brief 判断 s 是否为非空的十进制数字串（不允许符号）
 */
bool is_integer(const std::string &s);

}  // namespace cpjudge
