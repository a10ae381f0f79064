#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace cpjudge {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 执行外部命令，子进程继承当前进程的标准输入输出
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)，以 nullptr 结尾
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const char **argv);

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     std::vector<std::string> compiler = {"g++", "-O2"};
 *     std::filesystem::path source("/tmp/a.cpp");
 *     // 相当于 system("g++ -O2 /tmp/a.cpp -o /tmp/a");
 *     int exitcode = call_process(compiler, source, "-o", "/tmp/a");
 * @endcode
 */
template <typename... Args>
int call_process(Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv;
    for (auto &arg : list)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::stringstream ss;
    for (auto &arg : list)
        ss << arg << ' ';
    LOG(INFO) << ss.str();

    return exec_program(argv.data());
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace cpjudge
