#pragma once

#include <chrono>
#include <string>
#include "runner/launch_spec.hpp"

namespace coderun {

/**
 * @brief 隔离运行环境返回的原始运行结果，尚未分类
 */
struct provider_result {
    std::string output;

    std::string error;

    int exit_code = -1;

    /**
     * @brief 是否因为超过 deadline 被强制终止
     */
    bool timed_out = false;

    /**
     * @brief 隔离环境明确报告程序因为内存超限被杀死
     * 这是结构化的信号，分类时优先于 stderr 的文本匹配
     */
    bool oom_killed = false;
};

/**
 * @brief 隔离运行环境
 * 核心本身不实现隔离（没有 namespace、cgroup、seccomp），而是把声明式的
 * 资源、网络、文件系统策略交给隔离运行环境执行。
 *
 * 实现必须是线程安全的：批量运行时多个 worker 会同时调用 invoke。
 */
struct runtime_provider {
    virtual ~runtime_provider() = default;

    /**
     * @brief 按照 spec 启动一个新的隔离进程组，阻塞直到进程退出或者超过 deadline
     * 超过 deadline 时，实现必须在返回之前强制终止进程及其隔离环境，
     * 并将 timed_out 置为 true，output 和 error 为超时之前捕获的内容。
     * @param spec 沙箱调用描述
     * @param deadline 时钟时间上限
     * @return 原始运行结果
     * @throw provider_error 或其他 std::exception，若隔离环境本身无法调用
     */
    virtual provider_result invoke(const launch_spec &spec, std::chrono::seconds deadline) = 0;
};

}  // namespace coderun
