#pragma once

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "cpjudge/common/verdict.hpp"
#include "cpjudge/config.hpp"
#include "cpjudge/judge/report.hpp"
#include "cpjudge/language.hpp"

namespace cpjudge {

/**
 * @brief 对一份代码文件进行本地评测
 * 编译型语言和解释型语言的区别全部来自 language_traits，tester 本身不区分语言。
 * 所有评测结果都输出到构造时传入的流中，出错时抛出异常，不会直接结束进程。
 */
struct tester {
    /**
     * @param config 配置文件的内容，tester 会复制代码文件所用语言的配置
     * @param file 代码文件路径，语言由扩展名决定
     * @param out 评测结果的输出流
     * @throw unsupported_language_error 扩展名不对应任何支持的语言
     * @throw file_not_found_error 代码文件不存在
     * @throw configuration_error 配置文件中没有该语言的命令
     */
    tester(const configuration &config, const std::filesystem::path &file, std::ostream &out = std::cout);

    /**
     * @brief 编译代码文件，解释型语言不做任何事
     * 编译器的输出直接显示在终端上
     * @param debug 是否使用调试模式的编译命令
     * @throw compilation_error 编译器返回值非零
     */
    void compile(bool debug);

    /**
     * @brief 评测一个测试点
     * @param id 测试点编号
     * @param compile 是否先编译
     * @throw test_case_not_found_error 测试点的输入数据不存在
     * @throw compilation_error 编译失败
     */
    verdict run_one(int id, bool compile);

    /**
     * @brief 按编号升序评测所有测试点，并输出得分
     * 只在评测第一个测试点之前编译一次，某个测试点没有通过时仍然继续评测之后的测试点。
     * @return 没有任何测试点时返回 0 / 0
     */
    score run_all(bool compile);

    /**
     * @brief 以调试模式运行一个测试点
     * 程序的输出直接显示在终端上，不写入输出文件，也不给出评测结果
     * @return 程序的返回值
     */
    int debug_one(int id, bool compile);

    /**
     * @brief 以调试模式运行程序，输入数据由用户在终端中输入
     * @return 程序的返回值
     */
    int debug_with_user_input(bool compile);

    /**
     * @brief 代码文件的语言是否不需要编译，此时 --noCompile 选项没有意义
     */
    bool no_compile_is_redundant() const;

    language get_language() const;

private:
    /**
     * @brief 运行程序的命令，第一项为程序路径
     * 编译型语言为编译出的可执行文件，解释型语言为解释器命令加上代码文件
     */
    std::vector<std::string> run_command(bool debug) const;

    const std::string &command(bool debug) const;

    std::filesystem::path file;
    language lang;
    language_config lang_config;
    std::ostream &out;
};

}  // namespace cpjudge
