#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "runner/provider.hpp"

namespace coderun {

/**
 * @brief 通过 docker 命令行调用容器的隔离运行环境
 *
 * 每次调用都会创建一个独立命名的容器：
 * docker run --name coderun-<uuid> --memory <bytes> --memory-swap <bytes> --pids-limit <n>
 *            --network none --read-only [--tmpfs <scratch>:rw,size=16m]
 *            --mount type=bind,source=<mount_source>,target=<working_dir>,readonly
 *            -w <working_dir> <image> <command...>
 *
 * 杀死 docker 客户端并不会停止容器，因此无论调用如何结束，容器都会通过 docker rm -f 删除。
 */
struct docker_provider : public runtime_provider {
    /**
     * @param docker docker 命令行程序的路径
     * @param output_limit stdout 和 stderr 各自最多捕获的字节数
     */
    explicit docker_provider(const std::string &docker, int64_t output_limit);

    provider_result invoke(const launch_spec &spec, std::chrono::seconds deadline) override;

    /**
     * @brief 生成 docker run 的完整参数列表（包括 docker 程序本身）
     * @param docker docker 命令行程序的路径
     * @param spec 沙箱调用描述
     * @param container_name 容器名
     * @throw provider_error 若 spec 没有内存上限
     */
    static std::vector<std::string> build_arguments(const std::string &docker, const launch_spec &spec, const std::string &container_name);

private:
    bool inspect_oom_killed(const std::string &container_name);

    void remove_container(const std::string &container_name);

    std::string docker;
    int64_t output_limit;
};

}  // namespace coderun
