#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>

namespace coderun {

struct coderun_exception : std::exception {
    explicit coderun_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const coderun_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示运行系统本身的内部错误
 * 比如无法创建运行目录、无法写入代码文件
 */
struct internal_error : public coderun_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法调用隔离运行环境
 * 比如 docker 守护进程没有启动，或者镜像不存在
 */
struct provider_error : public coderun_exception {
    explicit provider_error(const std::string &message);
};

/**
 * @brief 表示请求的编程语言不在支持的语言表中
 * 必须在创建运行目录、启动沙箱之前抛出
 */
struct unsupported_language : public coderun_exception {
    const std::string language;

    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 表示目录运行时声明的入口文件在根目录下不存在（或者试图逃出根目录）
 */
struct entry_not_found : public coderun_exception {
    const std::string entry;

    explicit entry_not_found(const std::string &entry);
};

}  // namespace coderun
