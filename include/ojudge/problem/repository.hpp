#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "ojudge/problem/problem.hpp"

namespace ojudge {

/**
 * @brief 题库，根目录下每个子文件夹是一道题目
 *
 * <root>
 * ├── 259_bronze_cow_race
 * │   ├── config.json
 * │   └── ...
 * └── ...
 */
struct problem_repository {
    explicit problem_repository(const std::filesystem::path &root);

    /**
     * @brief 题库中所有题目的编号，按名称排序
     */
    std::vector<std::string> list() const;

    /**
     * @brief 加载一道题目
     * @param problem_id 题目编号，不能包含 "../" 这样跳出题库的路径
     * @throw std::invalid_argument 题目编号不合法
     * @throw problem_error 题目加载失败
     */
    problem_definition load(const std::string &problem_id) const;

    std::filesystem::path problem_dir(const std::string &problem_id) const;

    const std::filesystem::path &get_root() const;

private:
    std::filesystem::path root;
};

}  // namespace ojudge
