#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace ojudge {

struct judge_exception : std::exception {
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如运行目录无法创建、评测进程无法创建管道等，与选手程序无关
 */
struct internal_error : public judge_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示题目加载失败
 * 加载失败对整个评测是致命的，必须在运行任何测试点之前抛出
 */
struct problem_error : public judge_exception {
    explicit problem_error(const std::string &message);
};

/**
 * @brief 题目配置文件缺失、不是合法的 JSON，或者必需字段缺失/类型错误
 */
struct malformed_config : public problem_error {
    explicit malformed_config(const std::string &message);
};

/**
 * @brief 某个测试点的输入或输出数据在标准命名和旧命名下都找不到
 */
struct missing_test_data : public problem_error {
    enum class artifact {
        INPUT,
        OUTPUT
    };

    missing_test_data(std::size_t index, artifact kind, const std::string &location);

    /**
     * @brief 缺失数据的测试点编号（从 1 开始）
     */
    std::size_t index() const noexcept;

    artifact kind() const noexcept;

private:
    std::size_t test_index;
    artifact missing;
};

const char *artifact_name(missing_test_data::artifact kind);

}  // namespace ojudge
