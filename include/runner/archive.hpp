#pragma once

#include <filesystem>
#include <string>
#include "runner/executor.hpp"

namespace coderun {

/**
 * @brief 运行已经解压好的多文件项目
 * 压缩包的上传和解压不在这里处理，调用方提供解压后的目录。
 * 入口文件的检查和内存超限的改写与内联代码走同一条路径。
 *
 * @param exec executor
 * @param entry 入口文件相对于 root_dir 的路径
 * @param language 语言名
 * @param root_dir 解压后的目录
 * @param archive_name 压缩包名，仅用于运行历史，为空时使用 root_dir 的目录名
 */
execution_outcome run_from_directory(executor &exec,
                                     const std::string &entry,
                                     const std::string &language,
                                     const std::filesystem::path &root_dir,
                                     const std::string &archive_name = "");

}  // namespace coderun
