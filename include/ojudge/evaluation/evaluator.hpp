#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "ojudge/evaluation/registry.hpp"
#include "ojudge/judge/judger.hpp"
#include "ojudge/problem/repository.hpp"
#include "ojudge/sandbox/executor.hpp"

namespace ojudge {

struct evaluation_options {
    /**
     * @brief 选手程序目录，题目 p 的选手程序为 p.py、p.sh 等
     */
    std::filesystem::path solutions_dir;

    /**
     * @brief 只评测这些题目，为空时评测题库中所有题目
     */
    std::vector<std::string> problem_ids;

    /**
     * @brief 并发评测的线程数
     */
    std::size_t jobs = 1;
};

/**
 * @brief 批量评测
 * 每个线程从并发队列中取出题目编号，加载题目、找到选手程序并评测，
 * 结果记录在 evaluation_registry 中。同一道题目的测试点总是在同一个线程中顺序运行。
 */
struct evaluator {
    evaluator(const problem_repository &repo, executor &exec, evaluation_registry &registry);

    /**
     * @brief 运行一次批量评测
     * @param context_id 评测编号
     * @param options 评测选项
     * @return 最终报告，评测结束后 registry 中不再保存该评测
     */
    evaluation_report evaluate(const std::string &context_id, const evaluation_options &options);

    /**
     * @brief 评测一道题目
     * @return 评测结果的显示字符串，出错时为 Error
     */
    std::string evaluate_problem(const std::string &problem_id, const std::filesystem::path &solutions_dir) const;

    /**
     * @brief 要评测的题目编号：题库中存在且在过滤列表中的题目
     */
    std::vector<std::string> select_problems(const std::vector<std::string> &filter) const;

private:
    const problem_repository &repo;
    judger judge;
    evaluation_registry &registry;
};

/**
 * @brief 在选手程序目录中查找题目的选手程序
 * 依次尝试每种支持语言的扩展名
 * @return 找不到时为空
 */
std::optional<std::filesystem::path> find_solution(const std::filesystem::path &solutions_dir, const std::string &problem_id);

}  // namespace ojudge
