#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 一个测试点
 * 加载完成后只读，评测时按 index 顺序执行
 */
struct test_case {
    /**
     * @brief 测试点编号，从 1 开始
     */
    std::size_t index;

    /**
     * @brief 喂给选手程序 stdin 的输入数据
     */
    std::string input;

    /**
     * @brief 标准输出
     */
    std::string expected_output;
};

/**
 * @brief 题目
 * 题目目录结构如下：
 *
 * <problem dir>
 * ├── config.json // 题目配置，包含 problem_id、num_tests、runtime_limit、memory_limit 等字段
 * ├── 1.in        // 第 1 个测试点的输入
 * ├── 1.out       // 第 1 个测试点的标准输出
 * ├── I.2         // 旧命名的输入数据，加载时重命名为 2.in
 * ├── O.2         // 旧命名的标准输出，加载时重命名为 2.out
 * └── ...
 */
struct problem_definition {
    std::string problem_id;

    std::string name;

    std::string description;

    std::string level;

    /**
     * @brief 时间限制，单位为秒，不大于 0 时不限制
     */
    double time_limit = 0;

    /**
     * @brief 内存限制，单位为 MB，不大于 0 时不限制
     */
    int64_t memory_limit = 0;

    /**
     * @brief config.json 中声明的测试点数
     * 只有所有测试点的数据都找到后，tests 中才会有这么多测试点
     */
    std::size_t declared_tests = 0;

    /**
     * @brief 测试点，tests[i].index == i + 1
     */
    std::vector<test_case> tests;

    std::size_t num_tests() const;
};

/**
 * @brief 第 index 个测试点的标准文件名，比如 1.in、1.out
 */
std::string canonical_input_name(std::size_t index);
std::string canonical_output_name(std::size_t index);

/**
 * @brief 第 index 个测试点的旧文件名，比如 I.1、O.1
 */
std::string legacy_input_name(std::size_t index);
std::string legacy_output_name(std::size_t index);

/**
 * @brief 解析 config.json 的内容，不包含测试数据
 * 返回的题目只填写 declared_tests，tests 为空
 * @param config 题目配置
 * @param default_id config 中没有 problem_id 时使用的题目编号
 * @throw malformed_config 必需字段缺失或类型错误，problem_id 不是字符串，或者 num_tests 不是正整数
 */
problem_definition parse_problem_config(const nlohmann::json &config, const std::string &default_id);

/**
 * @brief 从题目目录加载题目
 * 先在目录锁的保护下将旧命名的测试数据重命名为标准命名，确认每个测试点的
 * 输入输出都存在后才读取内容，因此不会返回只有部分测试点的题目。
 * @param dir 题目目录
 * @throw malformed_config config.json 无法读取或内容不合法
 * @throw missing_test_data 某个测试点的输入或标准输出不存在
 */
problem_definition load_problem(const std::filesystem::path &dir);

/**
 * @brief 将题目目录中的旧命名测试数据重命名为标准命名
 * 已经是标准命名的题目不会被修改。调用方需要持有题目目录的独占锁。
 * @return 被重命名的文件数
 * @throw missing_test_data 两种命名都找不到
 */
std::size_t normalize_test_files(const std::filesystem::path &dir, std::size_t num_tests);

/**
 * @brief 从内存中的 JSON 记录加载题目
 * 记录的格式为 config.json 的字段加上 input、output 两个对象，
 * 对象的键为测试点编号（"1"），旧格式的键（"I.1"、"O.1"）会被转换为标准键。
 * @param record 题目记录
 * @param default_id 记录中没有 problem_id 时使用的题目编号
 */
problem_definition parse_problem(const nlohmann::json &record, const std::string &default_id = "");

/**
 * @brief 解析以题目编号为键的题目记录集合
 */
std::map<std::string, problem_definition> parse_problem_collection(const nlohmann::json &collection);

}  // namespace ojudge
