#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "ojudge/common/status.hpp"
#include "ojudge/judge/comparator.hpp"
#include "ojudge/problem/problem.hpp"
#include "ojudge/sandbox/executor.hpp"

namespace ojudge {

/**
 * @brief 一个测试点的评测报告，在测试点结束后通知给监听者
 */
struct test_report {
    std::size_t index;

    execution_result execution;

    /**
     * @brief 输出比较结果，程序没有正常运行结束时为空
     */
    std::optional<comparison_result> comparison;

    /**
     * @brief 该测试点的结果
     */
    status verdict;
};

/**
 * @brief 一次评测的最终结果
 */
struct judge_result {
    status verdict = status::JUDGE_ERROR;

    /**
     * @brief 实际运行过的测试点数
     */
    std::size_t tests_run = 0;

    /**
     * @brief 第一个没有通过的测试点编号，ACCEPTED 时为空
     */
    std::optional<std::size_t> failed_test;

    /**
     * @brief 诊断信息
     * ACCEPTED 时为 monostate，WRONG_ANSWER 时为 output_mismatch，
     * 运行失败时为该测试点的运行结果。
     */
    std::variant<std::monostate, output_mismatch, execution_result> detail;

    /**
     * @brief 人类可读的诊断信息，ACCEPTED 时为空字符串
     */
    std::string describe() const;
};

enum class session_state {
    NOT_STARTED,
    RUNNING,
    DONE
};

struct judger;

/**
 * @brief 一次评测的状态机
 * NOT_STARTED -> RUNNING(1) -> ... -> RUNNING(N) -> DONE(verdict)
 * 1. 测试点运行结果为 EXECUTED 且输出一致时进入下一个测试点
 * 2. 运行失败或者答案错误时立即结束，后续测试点不会被运行
 * 3. 最后一个测试点通过时结果为 ACCEPTED
 * 4. DONE 之后再调用 step 没有任何效果
 */
struct judge_session {
    judge_session(const judger &owner, const problem_definition &prob, const program &prog);

    session_state state() const;

    /**
     * @brief 正在运行或者下一个要运行的测试点编号，NOT_STARTED 时为 0
     */
    std::size_t current_test() const;

    bool done() const;

    /**
     * @brief 运行下一个测试点
     */
    void step();

    /**
     * @brief 一直运行直到评测结束
     */
    const judge_result &run();

    /**
     * @brief 评测结果
     * @throw std::logic_error 评测尚未结束
     */
    const judge_result &result() const;

private:
    const judger &owner;
    const problem_definition &prob;
    const program &prog;
    session_state current_state = session_state::NOT_STARTED;
    std::size_t next = 0;
    judge_result final_result;

    void finish(status verdict, std::size_t failed, std::variant<std::monostate, output_mismatch, execution_result> detail);
};

/**
 * @brief 评测器，负责依次运行题目的测试点并汇总结果
 * 评测器本身不保存评测状态，可以在多个线程中共享，前提是 executor 可以并发使用。
 */
struct judger {
    explicit judger(executor &exec);

    /**
     * @brief 评测选手程序
     * @param prob 已经加载完成的题目
     * @param prog 选手程序
     * @return 评测结果
     */
    judge_result judge(const problem_definition &prob, const program &prog) const;

    judge_session start(const problem_definition &prob, const program &prog) const;

    /**
     * @brief 注册测试点评测结束的事件回调函数
     * 回调函数在评测线程中被调用
     */
    void on_test_finished(std::function<void(const test_report &)> callback);

private:
    friend struct judge_session;

    executor &exec;
    std::vector<std::function<void(const test_report &)>> test_finished;

    void fire_test_finished(const test_report &report) const;
};

}  // namespace ojudge
