#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace coderun {

/**
 * @brief 外部程序的运行结果
 */
struct process_result {
    /**
     * @brief 外部程序的退出码
     * 如果外部程序因为信号退出，按照 shell 的习惯返回 128 + 信号编号
     */
    int exit_code = -1;

    /**
     * @brief 导致外部程序退出的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 外部程序是否因为超时被杀死
     */
    bool timed_out = false;

    /**
     * @brief 捕获的 stdout 内容
     */
    std::string output;

    /**
     * @brief 捕获的 stderr 内容
     */
    std::string error;
};

/**
 * @brief 调用外部程序并捕获其 stdout 和 stderr
 * @note 与 system(cmd) 的区别是，这个函数不经过 shell，参数按原样传给外部程序，避免了转义导致的注入问题
 * @note 外部程序运行在自己的进程组中，超时后整个进程组都会被 SIGKILL 杀死，
 *       函数返回时不会留下任何子进程
 * @param args 外部程序的路径 (args[0]) 和参数，args[0] 会在 PATH 中查找
 * @param timeout 时钟时间限制
 * @param output_limit stdout 和 stderr 各自最多保存多少字节，超出部分被丢弃并追加截断提示，负数表示不限制
 * @return 外部程序的运行结果
 * @throw std::system_error 如果无法创建管道、fork 失败或者外部程序无法执行（比如不存在）
 * @code{.cpp}
 *     // 相当于 sh -c 'echo hello'，但是 1 秒后会被强制终止
 *     auto result = exec_capture({"sh", "-c", "echo hello"}, std::chrono::seconds(1), 1024);
 * @endcode
 */
process_result exec_capture(const std::vector<std::string> &args, std::chrono::milliseconds timeout, int64_t output_limit);

/**
 * @brief 截断输出时追加的提示信息
 */
extern const char *const TRUNCATION_NOTICE;

/**
 * @brief 按 UTF-8 编码统计字符数
 * 不检查编码是否合法，非法的字节各算作一个字符
 */
std::size_t utf8_length(const std::string &text);

/**
 * @brief 截取前 max_chars 个字符，不会截断多字节字符
 */
std::string utf8_prefix(const std::string &text, std::size_t max_chars);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace coderun
