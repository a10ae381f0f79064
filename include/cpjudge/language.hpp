#pragma once

#include <string>

namespace cpjudge {

/**
 * @brief 支持评测的编程语言
 */
enum class language {
    cpp,
    py
};

/**
 * @brief 编程语言的静态属性
 * 通过 get_language_traits 查表获得，而不是为每种语言派生一个 tester
 */
struct language_traits {
    /**
     * @brief 语言在配置文件 languages 中的键名，比如 "cpp"
     */
    const char *name;

    /**
     * @brief 源代码文件扩展名，比如 ".cpp"
     */
    const char *extension;

    /**
     * @brief 单行注释的前缀，用于查找 time-limit 指令
     */
    const char *comment;

    /**
     * @brief 是否需要先编译才能运行
     * 为真时配置中的 command 是编译命令，否则 command 是解释器命令
     */
    bool needs_compile;
};

const language_traits &get_language_traits(language lang);

/**
 * @brief 根据代码文件的扩展名判断编程语言
 * @param extension 包含点号的扩展名，比如 ".py"
 * @throw unsupported_language_error 扩展名不对应任何支持的语言
 */
language language_from_extension(const std::string &extension);

}  // namespace cpjudge
