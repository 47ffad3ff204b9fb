#pragma once

#include <filesystem>
#include <string>
#include <variant>

namespace coderun {

/**
 * @brief 用户直接提交的代码
 * 运行前代码会被原样写入一个临时运行目录，文件名为语言的规范入口文件名。
 * 代码长度由调用方限制，这里不再检查。
 */
struct inline_code {
    std::string language;
    std::string text;
};

/**
 * @brief 已经解压好的多文件项目
 * 不会复制文件，root_dir 直接以只读方式挂载进沙箱。
 */
struct directory_entry {
    std::string language;

    /**
     * @brief 入口文件相对于 root_dir 的路径
     * 运行前会在主机上检查该文件确实存在于 root_dir 之内
     */
    std::string entry;

    std::filesystem::path root_dir;

    /**
     * @brief 上传的压缩包名，仅用于运行历史中的描述
     */
    std::string archive_name;
};

/**
 * @brief 一次运行的输入，构造之后不再修改
 */
using source_unit = std::variant<inline_code, directory_entry>;

/**
 * @brief 获得运行输入所请求的语言名
 */
const std::string &language_of(const source_unit &unit);

}  // namespace coderun
