#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "ojudge/common/status.hpp"

namespace ojudge {

/**
 * @brief 某一方输出已经结束时，该行显示为此标记
 */
extern const char *const EOF_MARKER;

/**
 * @brief 输出与标准输出第一处不一致的位置
 */
struct output_mismatch {
    /**
     * @brief 行号，从 1 开始
     */
    std::size_t line;

    /**
     * @brief 标准输出的该行，标准输出已经结束时为空
     */
    std::optional<std::string> expected;

    /**
     * @brief 选手输出的该行，选手输出已经结束时为空
     */
    std::optional<std::string> actual;

    /**
     * @brief 形如 "Mismatch at line N:\n  Expected: X\n  Got     : Y" 的诊断信息
     */
    std::string describe() const;
};

struct comparison_result {
    /**
     * @brief ACCEPTED 或 WRONG_ANSWER
     */
    status verdict;

    /**
     * @brief WRONG_ANSWER 时第一处不一致的位置
     */
    std::optional<output_mismatch> diff;
};

/**
 * @brief 对输出进行规范化
 * 1. 去掉整段文本首尾的空白字符
 * 2. 按 \n、\r\n、\r 分行
 * 3. 去掉每行末尾的空白字符
 */
std::vector<std::string> normalize_output(const std::string &text);

/**
 * @brief 比较选手输出与标准输出
 * 规范化后两边的行数和每行内容完全一致时为 ACCEPTED，否则为 WRONG_ANSWER。
 */
comparison_result compare_outputs(const std::string &actual, const std::string &expected);

}  // namespace ojudge
