#pragma once

#include <filesystem>
#include <string>

namespace funcjudge::sandbox {

/**
 * @brief 一个提交的工作目录
 * 构造时在根目录下创建一个随机命名（uuid）的子目录，析构时删除整个子目录。
 * 无论评测成功、失败还是抛出异常，工作目录都会被清理。
 */
struct workspace {
    /**
     * @brief 创建工作目录
     * @param root 工作目录的父目录，不存在时会被创建
     * @throw internal_error 若无法创建目录
     */
    explicit workspace(const std::filesystem::path &root);

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    ~workspace();

    const std::filesystem::path &path() const;

    /**
     * @brief 在工作目录中写入文件
     * @param name 文件名，不能包含 .. 或者以 / 开头
     * @param content 文件内容
     * @return 文件的完整路径
     * @throw internal_error 若文件名不安全或写入失败
     */
    std::filesystem::path write_file(const std::string &name, const std::string &content) const;

private:
    std::filesystem::path dir;
};

}  // namespace funcjudge::sandbox
