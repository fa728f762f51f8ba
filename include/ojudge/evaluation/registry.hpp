#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "ojudge/common/utils.hpp"

namespace ojudge {

/**
 * @brief 评测失败（题目无法加载、找不到选手程序、内部错误）时记录的结果
 */
extern const char *const EVALUATION_ERROR;

/**
 * @brief 一次批量评测的统计报告
 */
struct evaluation_report {
    /**
     * @brief 每道题目的评测结果，键为题目编号，值为 Accepted、Wrong Answer 等显示字符串或者 Error
     */
    std::map<std::string, std::string> tasks;

    /**
     * @brief 评测总耗时，单位为秒
     */
    double time = 0;

    std::size_t accepted() const;

    std::size_t total() const;

    /**
     * @brief 通过率，没有任何题目时为 0
     */
    double pass_rate() const;

    /**
     * @brief 序列化为 {"pass_1", "time", "accepted", "total", "tasks"}
     */
    nlohmann::json to_json() const;
};

/**
 * @brief 保存所有进行中的批量评测
 * 第一次使用某个评测编号时创建报告，评测完成后通过 release 取出并删除，
 * 因此评测状态不会在多次评测之间泄漏。所有操作都是线程安全的。
 */
struct evaluation_registry {
    /**
     * @brief 获取评测编号对应的报告，不存在时创建
     * @return 真表示新创建了报告
     */
    bool acquire(const std::string &context_id);

    /**
     * @brief 记录一道题目的评测结果
     * @throw std::invalid_argument 评测编号不存在
     */
    void record(const std::string &context_id, const std::string &problem_id, const std::string &verdict);

    /**
     * @brief 当前报告的副本，评测编号不存在时为空
     */
    std::optional<evaluation_report> snapshot(const std::string &context_id) const;

    /**
     * @brief 结束评测，删除并返回最终报告，报告的 time 为从 acquire 到 release 的时间
     * @throw std::invalid_argument 评测编号不存在
     */
    evaluation_report release(const std::string &context_id);

    bool contains(const std::string &context_id) const;

    std::size_t size() const;

private:
    struct entry {
        evaluation_report report;
        elapsed_time started;
    };

    mutable std::mutex mut;
    std::map<std::string, entry> contexts;
};

}  // namespace ojudge
