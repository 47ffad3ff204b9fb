#pragma once

#include <filesystem>
#include <string>

namespace coderun {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 原样写入文件，文件已存在时覆盖
 * @throw std::system_error 若文件无法打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击：用户声明的入口文件
 * 如果是绝对路径或者包含 ".." 路径段，那么有可能让沙箱挂载、运行根目录之外的文件。
 * @param subpath 被检查的相对路径
 * @return subpath 本身
 * @throw std::invalid_argument 若 subpath 为空、是绝对路径或包含 ".." 路径段
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 检查 path 解析符号链接之后是否仍然位于 root 目录之内
 * @param root 根目录，必须存在
 * @param path 被检查的路径
 */
bool is_inside_directory(const std::filesystem::path &root, const std::filesystem::path &path);

}  // namespace coderun
