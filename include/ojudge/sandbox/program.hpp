#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 表示选手程序使用的语言
 * 目前只支持解释型语言，选手代码不需要编译
 */
struct language {
    /**
     * @brief 语言名，比如 python、sh
     */
    std::string name;

    /**
     * @brief 选手代码文件的扩展名（包含 "."）
     */
    std::string extension;

    /**
     * @brief 根据选手代码的路径生成运行命令
     */
    std::function<std::vector<std::string>(const std::filesystem::path &)> run_command;
};

/**
 * @brief 根据语言名查找语言
 * @throw std::invalid_argument 不支持该语言
 */
const language &get_language(const std::string &name);

/**
 * @brief 根据扩展名（包含 "."）查找语言
 * @return 找不到时返回 nullptr
 */
const language *find_language_by_extension(const std::string &extension);

std::vector<std::string> supported_languages();

/**
 * @brief 表示可以被执行的选手程序
 */
struct program {
    virtual ~program() = default;

    /**
     * @brief 运行选手程序的命令行参数，第一个元素为可执行文件
     */
    virtual std::vector<std::string> get_run_command() const = 0;

    /**
     * @brief 选手程序的主文件，执行前检查该文件是否存在
     */
    virtual std::filesystem::path get_run_path() const = 0;
};

/**
 * @brief 由代码文本构成的选手程序
 * 构造时将代码写入 RUN_DIR 下一个以 uuid 命名的文件夹，析构时删除该文件夹
 * （DEBUG 模式下保留）。因此无论评测结果如何、是否抛出异常，临时文件都会被清理。
 */
struct source_program : public program {
    /**
     * @param lang 选手程序语言
     * @param source 选手代码
     * @throw internal_error 无法创建运行目录或写入代码
     */
    source_program(const language &lang, const std::string &source);
    ~source_program() override;

    source_program(const source_program &) = delete;
    source_program &operator=(const source_program &) = delete;

    std::vector<std::string> get_run_command() const override;

    std::filesystem::path get_run_path() const override;

    /**
     * @brief 本程序的临时运行目录
     */
    const std::filesystem::path &get_work_dir() const;

private:
    const language &lang;
    std::filesystem::path workdir;
    std::filesystem::path source_path;
};

/**
 * @brief 已经在本地的可执行文件
 * 不负责清理文件
 */
struct executable_program : public program {
    executable_program(const std::filesystem::path &path, const std::vector<std::string> &args = {});

    std::vector<std::string> get_run_command() const override;

    std::filesystem::path get_run_path() const override;

private:
    std::filesystem::path path;
    std::vector<std::string> args;
};

}  // namespace ojudge
