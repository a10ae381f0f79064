#pragma once

namespace cpjudge {

/**
 * @brief 表示一个测试点的评测结果
 */
enum class verdict {
    /**
     * @brief 选手程序本测试点评测通过
     * 输出与标准答案完全一致，或者逐行去掉首尾空白字符后一致（此时会提示检查空白字符）
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 选手程序正常退出，但输出与标准答案不一致。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 选手程序运行时间超出限制
     * 比较的是时钟时间，超出时间限制加上 500ms 宽限之后进程组会被强制杀死。
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值非零，或者因为信号而终止。
     * 评测时找不到输出文件或者标准答案文件也会返回该结果。
     */
    RUNTIME_ERROR = 3
};

/**
 * @brief 评测结果的完整名称，比如 "Accepted"
 */
const char *get_display_message(verdict);

/**
 * @brief 评测结果的定宽标签，比如 " A C "
 */
const char *get_tag(verdict);

}  // namespace cpjudge
