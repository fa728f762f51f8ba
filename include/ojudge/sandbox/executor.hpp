#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "ojudge/common/status.hpp"
#include "ojudge/sandbox/program.hpp"
#include "ojudge/sandbox/resource_limiter.hpp"

namespace ojudge {

/**
 * @brief 运行一次选手程序的结果
 * 只在一个测试点的评测过程中存在，不会被持久化
 */
struct execution_result {
    execution_status status = execution_status::JUDGE_ERROR;

    /**
     * @brief 选手程序的 stdout 输出
     * 超时时不保留
     */
    std::string output;

    /**
     * @brief 选手程序的 stderr 输出
     */
    std::string error;

    /**
     * @brief 选手程序的返回值
     * 被信号终止时为 128 + 信号编号，选手程序没有运行时为空
     */
    std::optional<int> exitcode;

    /**
     * @brief 终止选手程序的信号
     */
    std::optional<int> signal;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间（用户态 + 内核态），单位为秒
     */
    double cpu_time = -1;

    /**
     * @brief 峰值常驻内存（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 评测系统给出的说明，比如 Judge Error 的原因
     */
    std::string message;
};

/**
 * @brief 运行选手程序的接口
 * 评测器只依赖该接口，测试时可以替换为不真正创建进程的实现
 */
struct executor {
    virtual ~executor() = default;

    /**
     * @brief 使用给定输入运行选手程序
     * @param prog 选手程序
     * @param input 喂给 stdin 的输入数据
     * @param limits 资源限制
     * @return 运行结果，该函数不会抛出异常，所有错误都表现为 JUDGE_ERROR
     */
    virtual execution_result run(const program &prog, const std::string &input, const resource_limits &limits) = 0;
};

/**
 * @brief 在独立进程中运行选手程序
 * 1. 检查选手程序主文件是否存在，不存在则 Judge Error
 * 2. 创建 stdin、stdout、stderr 管道，以及用于汇报 exec 失败的管道
 * 3. 调用 fork 创建子进程
 *    1. 子进程进入新的进程组，以便我们通过 SIGKILL 杀死进程组内所有进程
 *    2. 重定向标准输入输出，恢复 SIGPIPE 的默认处理
 *    3. 通过 resource_limiter 设置 CPU 时间和内存限制
 *    4. exec 选手程序，失败时通过管道将 errno 告知父进程
 * 4. 父进程通过 poll 同时写入 stdin、读取 stdout 和 stderr，直到管道全部关闭
 *    或者超出时钟时间限制
 * 5. 超时则杀死整个进程组，结果为 Time Limit Exceeded
 * 6. 否则根据退出状态和 stderr 判断结果：
 *    1. 因 SIGXCPU 终止为 Time Limit Exceeded
 *    2. 返回值非零、因其他信号终止、或者 stderr 非空为 Runtime Error
 *    3. 否则为 Executed
 */
struct sandbox_executor : public executor {
    sandbox_executor();
    explicit sandbox_executor(std::unique_ptr<resource_limiter> limiter);

    execution_result run(const program &prog, const std::string &input, const resource_limits &limits) override;

    const resource_limiter &get_limiter() const;

private:
    std::unique_ptr<resource_limiter> limiter;

    execution_result spawn(const std::vector<std::string> &command, const std::string &input, const resource_limits &limits);
};

}  // namespace ojudge
