#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "config.hpp"
#include "runner/language.hpp"
#include "runner/provider.hpp"

namespace coderun {

/**
 * @brief 一次运行的最终结果，按值返回给调用方
 */
struct execution_outcome {
    /**
     * @brief 程序的 stdout
     */
    std::string output;

    /**
     * @brief 程序的 stderr，或者运行系统给出的说明
     */
    std::string error;

    /**
     * @brief 程序的退出码，或者 config.hpp 中 error_codes 定义的退出码
     */
    int exit_code = E_INTERNAL_FAILURE;

    status classification = status::INTERNAL_FAILURE;
};

/**
 * @brief 隔离环境杀死进程时可能在 stderr 中留下的标记，区分大小写
 * @note 文本匹配是启发式的：如果某种语言运行时自己的错误信息恰好包含
 *       这些子串，就会被误判为 RESOURCE_KILLED。
 */
extern const std::vector<std::string> KILL_MARKERS;

/**
 * @brief 将字节数转换为 docker 的写法，比如 134217728 -> 128m
 */
std::string format_memory(int64_t bytes);

/**
 * @brief 程序因为内存超限被杀死时，替换 stderr 的固定提示信息
 */
std::string resource_killed_message(int64_t memory_bytes);

/**
 * @brief 对隔离环境的原始运行结果进行分类
 * 分类顺序：
 * 1. 超时 -> TIMED_OUT，保留已经捕获的输出；
 * 2. 隔离环境报告 OOM，或退出码为 137，或 stderr 包含 KILL_MARKERS -> RESOURCE_KILLED，
 *    丢弃 stdout，stderr 替换为固定的提示信息；
 * 3. stderr 包含语言自己的内存不足标记 -> RUNTIME_ERROR，保留原始 stderr 和退出码；
 * 4. 退出码为 0 -> SUCCESS，否则 -> RUNTIME_ERROR，原样返回 stdout 和 stderr。
 * @param result 隔离环境的原始运行结果
 * @param lang 运行的语言
 * @param memory_bytes 配置的内存上限，用于生成提示信息
 */
execution_outcome classify(const provider_result &result, const language &lang, int64_t memory_bytes);

/**
 * @brief 构造一个不是由沙箱内程序产生的结果
 */
execution_outcome make_outcome(status classification, int exit_code, const std::string &error);

void to_json(nlohmann::json &j, const execution_outcome &outcome);

}  // namespace coderun
