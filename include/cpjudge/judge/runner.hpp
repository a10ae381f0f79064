#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cpjudge {

/**
 * @brief 选手程序一次运行的结果
 */
struct execution_result {
    /**
     * @brief 程序的返回值
     * 若程序因为信号而终止，则为 128 + 信号编号
     */
    int exit_code = 0;

    /**
     * @brief 程序是否因为信号而终止，此时 signal 为信号编号
     */
    bool signaled = false;
    int signal = 0;

    /**
     * @brief 程序是否因为超出时间限制而被杀死
     * 此时 output 和 error 均为空，程序已经产生的输出不会被保留
     */
    bool timed_out = false;

    /**
     * @brief 程序的标准输出
     */
    std::string output;

    /**
     * @brief 程序的标准错误输出
     */
    std::string error;

    /**
     * @brief 程序运行的时钟时间
     */
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief 程序是否在时间限制内正常退出且返回值为 0
     */
    bool succeeded() const;
};

/**
 * @brief 运行选手程序并收集输出
 * 1. 以 input_path 作为标准输入，管道连接标准输出和标准错误输出
 * 2. 子进程放在独立的进程组中，以便超时时通过 SIGKILL 杀死进程组内所有进程
 * 3. 在 time_limit + TIME_LIMIT_GRACE 毫秒后仍未结束的程序会被杀死，并标记为超时
 * 4. 程序正常退出且返回值为 0 时，将标准输出写入 output_path（覆盖原有内容）；
 *    超时或者返回值非零时不会修改 output_path
 * 调用会阻塞直到程序结束或者被杀死。
 * @param command 程序路径，不含 '/' 时在 PATH 中查找
 * @param args 程序的参数
 * @param input_path 输入数据文件
 * @param output_path 输出文件
 * @param time_limit 时间限制（毫秒）
 * @throw file_not_found_error 输入数据文件无法打开
 * @throw internal_error 创建管道、fork 等系统调用失败
 */
execution_result run(const std::string &command, const std::vector<std::string> &args,
                     const std::filesystem::path &input_path, const std::filesystem::path &output_path,
                     int time_limit);

/**
 * @brief 以调试模式运行程序
 * 程序的标准输出和标准错误输出直接连接到当前终端，没有时间限制，也不会写入输出文件。
 * @param input_path 输入数据文件，为空时从终端读入
 * @return 程序的返回值，若程序因为信号而终止，则为 128 + 信号编号
 */
int run_interactive(const std::string &command, const std::vector<std::string> &args,
                    const std::optional<std::filesystem::path> &input_path);

/**
 * @brief 将配置中的命令字符串按空白字符切分为程序路径和参数
 * @note 不支持引号和转义，"g++ -DNAME=\"a b\"" 会被切成 3 段
 * @throw configuration_error 命令为空
 */
std::vector<std::string> split_command(const std::string &command);

}  // namespace cpjudge
