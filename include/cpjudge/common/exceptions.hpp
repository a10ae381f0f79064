#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace cpjudge {

struct judge_exception : std::exception {
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是创建管道、fork、poll 等系统调用失败
 */
struct internal_error : public judge_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示需要的文件不存在
 * 比如选手代码文件不存在，或者指定的测试数据输入文件不存在
 */
struct file_not_found_error : public judge_exception {
    explicit file_not_found_error(const std::string &path);
};

/**
 * @brief 表示指定编号的测试点不存在
 */
struct test_case_not_found_error : public judge_exception {
    explicit test_case_not_found_error(int id, const std::string &input_path);
};

/**
 * @brief 表示配置文件缺失、格式错误，或者配置文件中没有指定需要的命令
 */
struct configuration_error : public judge_exception {
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示代码文件的扩展名不对应任何支持的编程语言
 */
struct unsupported_language_error : public judge_exception {
    explicit unsupported_language_error(const std::string &extension);
};

/**
 * @brief 表示选手程序编译错误
 */
struct compilation_error : public std::runtime_error {
public:
    const std::string error_log;

    explicit compilation_error(const std::string &what, const std::string &error_log);
};

}  // namespace cpjudge
