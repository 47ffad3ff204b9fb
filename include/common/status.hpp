#pragma once

#include <ostream>

namespace coderun {

/**
 * @brief 表示一次运行的分类结果
 * 每次运行都恰好产生一个分类结果，核心的公开接口不会以异常的形式报告失败。
 */
enum class status {
    /**
     * @brief 程序正常退出，且退出码为 0
     */
    SUCCESS = 0,

    /**
     * @brief 程序以非零退出码退出
     * 也包括程序自己观察到内存分配失败的情况（比如 Python 的 MemoryError），
     * 此时保留程序自己的错误输出和退出码。
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief 程序运行超出时钟时间限制，已被强制终止
     */
    TIMED_OUT = 2,

    /**
     * @brief 程序被隔离环境强制杀死，一般是内存超出限制
     * 此时 stderr 会被替换成固定的提示信息，而不会把底层的信号信息透露给用户。
     */
    RESOURCE_KILLED = 3,

    /**
     * @brief 请求的编程语言不受支持
     * 这种情况下不会创建运行目录，也不会调用隔离环境。
     */
    UNSUPPORTED_LANGUAGE = 4,

    /**
     * @brief 目录运行时声明的入口文件不存在
     */
    ENTRY_NOT_FOUND = 5,

    /**
     * @brief 内部错误，运行系统无法调用隔离环境
     * 比如 docker 不可用、无法创建运行目录。
     */
    INTERNAL_FAILURE = 6
};

const char *get_display_message(status);

std::ostream &operator<<(std::ostream &os, status stat);

}  // namespace coderun
