#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "cpjudge/language.hpp"

namespace cpjudge {

/**
 * @brief 超出时间限制之后还允许程序继续运行的时间（毫秒）
 * 程序实际被杀死的时刻为 time-limit + TIME_LIMIT_GRACE
 */
extern int TIME_LIMIT_GRACE;

/**
 * @brief 代码文件没有 time-limit 指令时使用的时间限制（毫秒）
 */
extern int DEFAULT_TIME_LIMIT;

/**
 * @brief 对比表格每一栏的最小宽度
 */
extern int MIN_COLUMN_WIDTH;

/**
 * @brief 是否使用终端颜色输出评测结果
 * 标准输出不是终端时由 main 关闭
 */
extern bool USE_COLOR;

/**
 * @brief 一种编程语言的配置
 */
struct language_config {
    /**
     * @brief 运行命令
     * 对于需要编译的语言是编译器命令（比如 "g++ -std=gnu++17 -O2"），
     * 否则是解释器命令（比如 "python3"）。命令按空白字符切分，不支持引号。
     */
    std::string command;

    /**
     * @brief 调试模式下使用的命令，格式同 command
     */
    std::string debug_command;

    /**
     * @brief 新建代码文件时使用的模板路径
     */
    std::string template_path;

    /**
     * @brief 提交到各个 OJ 时该语言对应的编号
     */
    std::map<std::string, std::string> aliases;
};

void from_json(const nlohmann::json &j, language_config &config);
void to_json(nlohmann::json &j, const language_config &config);

/**
 * @brief 配置文件的内容
 * 配置文件可能和其他工具共享，不认识的键会被忽略
 */
struct configuration {
    std::string preferred_language = "cpp";

    /**
     * @brief 键为语言名，参见 language_traits::name
     */
    std::map<std::string, language_config> languages;

    /**
     * @brief 查找语言的配置
     * @throw configuration_error 配置文件中没有该语言
     */
    const language_config &get_language_config(language lang) const;
};

void from_json(const nlohmann::json &j, configuration &config);
void to_json(nlohmann::json &j, const configuration &config);

/**
 * @brief 默认配置，cpp 和 py 两种语言都已配置好
 */
configuration default_configuration();

/**
 * @brief 默认的配置文件查找路径，按优先级排序
 * $HOME/cpjudge-config.json
 * $HOME/.cpjudge/cpjudge-config.json
 * $HOME/.config/cpjudge/cpjudge-config.json
 */
std::vector<std::filesystem::path> default_configuration_paths();

/**
 * @brief 读取配置文件
 * @param path 用户指定的配置文件，优先于默认路径查找
 * @return 第一个存在的配置文件的内容
 * @throw configuration_error 所有路径下都没有配置文件，或者配置文件格式错误
 */
configuration read_configuration(const std::optional<std::filesystem::path> &path);

/**
 * @brief 写入默认配置文件
 * @return 若文件已经存在则不覆盖，返回 false
 */
bool write_default_configuration(const std::filesystem::path &path);

}  // namespace cpjudge
