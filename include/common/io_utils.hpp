#pragma once

#include <filesystem>
#include <string>

namespace funcjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将文本覆盖写入文件
 * @param path 文件路径，父目录必须存在
 * @param content 要写入的内容
 * @throw internal_error 若文件无法打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录或者绝对路径的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，写入工作目录的
 * 文件名必须留在工作目录内部。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace funcjudge
