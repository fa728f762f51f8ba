#pragma once

#include <string>

namespace ojudge {

/**
 * @brief 表示一个测试点或整个提交的评测结果
 * 显示字符串（Accepted、Wrong Answer 等）是对外的稳定接口，
 * 调用方只应当匹配这几个值。
 */
enum class status {
    /**
     * @brief 所有测试点的输出都与标准输出一致
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 忽略行末空白和文末空行后，输出仍与标准输出不一致。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值非零、被信号杀死，或者向 stderr 写入了任何内容。
     * 内存超限（RLIMIT_AS）一般也表现为运行时错误。
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 用户程序运行时间超出限制
     * 时钟时间超时，或者因 CPU 时间超限收到 SIGXCPU。
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 评测系统出错
     * 比如选手程序文件不存在、无法创建子进程等。
     */
    JUDGE_ERROR = 4
};

/**
 * @brief 表示单次运行选手程序的结果
 * 只在一个测试点内部使用，EXECUTED 表示可以进入输出比较
 */
enum class execution_status {
    EXECUTED = 0,
    RUNTIME_ERROR = 1,
    TIME_LIMIT_EXCEEDED = 2,
    JUDGE_ERROR = 3
};

const char *get_display_message(status);

const char *get_display_message(execution_status);

/**
 * @brief 将运行失败的结果映射为同名的评测结果
 * @note EXECUTED 没有对应的最终评测结果，传入时抛出 std::invalid_argument
 */
status to_status(execution_status stat);

/**
 * @brief 解析显示字符串
 * @throw std::invalid_argument 不是已知的评测结果
 */
status parse_status(const std::string &text);

}  // namespace ojudge
