#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>
#include "gmock/gmock.h"
#include "runner/provider.hpp"

/**
 * 测试用的隔离运行环境
 * 用法：
 * 1. fake_provider provider([](const launch_spec &spec) { return make_result(0, "hello\n"); });
 * 2. executor exec(provider, language_table::defaults(), test_limits());
 * 3. 检查 exec.run 的结果，以及 provider.invocations()、provider.max_in_flight()
 */
namespace coderun {

struct fake_provider : public runtime_provider {
    using handler_t = std::function<provider_result(const launch_spec &)>;

    explicit fake_provider(handler_t handler);

    provider_result invoke(const launch_spec &spec, std::chrono::seconds deadline) override;

    /**
     * @brief invoke 被调用的次数
     */
    std::size_t invocations() const;

    /**
     * @brief 同时进行的 invoke 的最大数量
     */
    std::size_t max_in_flight() const;

    /**
     * @brief 所有 invoke 收到的沙箱调用描述，按调用开始的顺序
     */
    std::vector<launch_spec> received() const;

    std::chrono::seconds last_deadline() const;

private:
    handler_t handler;
    std::atomic<std::size_t> count{0};
    std::atomic<std::size_t> in_flight{0};
    std::atomic<std::size_t> high_water{0};
    std::atomic<long> deadline{0};
    mutable std::mutex mut;
    std::vector<launch_spec> specs;
};

struct mock_provider : public runtime_provider {
    MOCK_METHOD(provider_result, invoke, (const launch_spec &spec, std::chrono::seconds deadline), (override));
};

provider_result make_result(int exit_code, const std::string &output = "", const std::string &error = "");

/**
 * @brief 测试使用的资源限制：128MB 内存、10 秒、64 个进程
 */
resource_limits test_limits();

/**
 * @brief 为测试创建独立的 RUN_DIR
 */
void setup_test_environment();

/**
 * @brief 统计 RUN_DIR 中残留的运行目录
 */
std::size_t count_run_directories();

}  // namespace coderun
