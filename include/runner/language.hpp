#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace coderun {

/**
 * @brief 表示一种支持的编程语言
 * 语言决定了沙箱使用的镜像、解释器以及代码保存的文件名。
 * 增加一种语言只需要在语言表中增加一项，不需要修改代码结构。
 */
struct language {
    /**
     * @brief 语言名，比如 python、node
     * 匹配时不区分大小写
     */
    std::string name;

    /**
     * @brief 运行该语言使用的容器镜像
     * @code
     * python:3.11-slim
     * @endcode
     */
    std::string image;

    /**
     * @brief 解释器及其参数，入口文件名会追加在最后
     * @code{.json}
     * ["python"]
     * @endcode
     */
    std::vector<std::string> interpreter;

    /**
     * @brief 内联代码保存时使用的规范入口文件名
     */
    std::string entry_filename;

    /**
     * @brief 语言运行时自己报告内存不足时 stderr 中出现的标记
     * 比如 Python 的 MemoryError。与容器被杀死不同，出现这个标记表示程序
     * 自己观察到了内存分配失败，此时应该把程序自己的错误信息返回给用户。
     * 为空表示该语言没有这种标记。
     */
    std::string oom_marker;

    /**
     * @brief 运行时需要的可写临时目录（容器内路径）
     * 容器根文件系统是只读的，有些运行时必须要有可写的临时目录才能启动。
     * 为空表示不需要。
     */
    std::string scratch_dir;
};

/**
 * @brief 支持的编程语言表
 * 语言表在启动时构造，之后只读，因此可以被多个 worker 并发访问。
 */
struct language_table {
    language_table() = default;

    /**
     * @brief 根据语言列表构造语言表
     * @throw std::invalid_argument 若语言名重复或者缺少必须的字段
     */
    explicit language_table(const std::vector<language> &languages);

    /**
     * @brief 根据语言名查找语言，不区分大小写
     * @return 找到的语言，找不到返回 nullptr
     */
    const language *find(const std::string &name) const;

    /**
     * @brief 根据语言名查找语言，不区分大小写
     * @throw unsupported_language 若语言不在语言表中
     */
    const language &at(const std::string &name) const;

    /**
     * @brief 所有支持的语言名，按字典序排列
     */
    std::vector<std::string> names() const;

    std::size_t size() const;

    /**
     * @brief 默认的语言表，包含 python 和 node
     */
    static language_table defaults();

    /**
     * @brief 从 JSON 中读取语言表
     * @code{.json}
     * {
     *   "languages": [
     *     {
     *       "name": "python",
     *       "image": "python:3.11-slim",
     *       "interpreter": ["python"],
     *       "entry": "user_code.py",
     *       "oom_marker": "MemoryError",  // 可选
     *       "scratch": "/tmp"             // 可选
     *     }
     *   ]
     * }
     * @endcode
     * @throw std::invalid_argument 若 JSON 格式不正确
     */
    static language_table from_json(const nlohmann::json &j);

    /**
     * @brief 从 JSON 文件中读取语言表
     * @throw std::invalid_argument 若文件内容不是合法的语言表
     */
    static language_table load(const std::filesystem::path &path);

private:
    // 键为小写的语言名
    std::map<std::string, language> languages;
};

}  // namespace coderun
