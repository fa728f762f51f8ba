#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开时
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在则覆盖
 * @throw std::system_error 文件无法写入时
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 题目编号会被拼接到题库目录后面，如果题目编号包含 "../"，
 * 就可能读到题库以外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 列出文件夹内的所有子文件夹名（不递归，按名称排序）
 * @param dir 要被统计的文件夹
 * @return 子文件夹名，dir 不是文件夹时为空
 */
std::vector<std::string> list_directories(const std::filesystem::path &dir);

struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&);
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    std::filesystem::path file() const;

    void release();
private:
    int fd = -1;
    bool valid = false;
    std::filesystem::path lock_file;
};

/**
 * @brief 锁文件夹
 * 通过对文件夹根目录下的 .lock 文件加锁实现
 * @param dir 要被加锁的文件夹，必须已经存在
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @return 文件锁
 */
scoped_file_lock lock_directory(const std::filesystem::path &dir, bool shared);

}  // namespace ojudge
