#pragma once

#include <boost/program_options.hpp>
#include <filesystem>
#include <string>

namespace ojudge {

/**
 * @brief 选手程序的运行根目录
 * 每次评测都会在这里创建一个以 uuid 命名的临时文件夹保存选手代码，
 * 评测结束后删除。多个评测并发运行时互不冲突。
 * @defaultValue /tmp/ojudge，可以通过 --run-dir 或环境变量 RUNDIR 指定
 *
 * RUN_DIR
 * ├── 1b4e28ba-2fa1-11d2-883f-0016d3cca427 // 随机生成的 uuid
 * │   └── main.py // 选手程序代码
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 运行 Python 选手程序的解释器
 * @defaultValue python3，可以通过 --interpreter 或环境变量 PYTHON 指定
 */
extern std::string PYTHON_INTERPRETER;

/**
 * @brief 运行 shell 选手程序的解释器
 */
extern std::string SHELL_INTERPRETER;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除选手程序的运行目录，
 * 以便手动检查评测时使用的文件。
 */
extern bool DEBUG;

/**
 * @brief 添加两个命令行程序共用的选项：--run-dir、--interpreter、--debug
 */
void add_common_options(boost::program_options::options_description &desc);

/**
 * @brief 根据命令行选项设置全局配置，命令行没有给出时从环境变量 RUNDIR、PYTHON、DEBUG 读取
 */
void load_common_options(const boost::program_options::variables_map &vm);

}  // namespace ojudge
