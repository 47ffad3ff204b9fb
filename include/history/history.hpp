#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

namespace coderun {

/**
 * @brief 一条运行历史
 */
struct history_record {
    /**
     * @brief 运行结束的本地时间，格式为 %Y-%m-%d %H:%M:%S
     */
    std::string timestamp;

    std::string language;

    /**
     * @brief 内联运行为代码（截断到 HISTORY_CODE_CHARS 个字符），
     * 目录运行为描述信息，比如 "[zip run] main.py (from project.zip)"
     */
    std::string code;

    std::string output;

    std::string error;

    int exit_code = 0;

    status classification = status::SUCCESS;
};

void to_json(nlohmann::json &j, const history_record &record);

void from_json(const nlohmann::json &j, history_record &record);

/**
 * @brief 运行历史的存储
 * 核心只负责在每次运行结束后调用 append，不拥有存储本身。
 * 调用是 fire-and-forget 的：append 抛出的异常只会被记录到日志，
 * 不会影响运行结果。
 *
 * 实现必须是线程安全的：批量运行时多个 worker 会同时调用 append。
 */
struct history {
    virtual ~history();

    /**
     * @brief 追加一条运行历史
     */
    virtual void append(const history_record &record) = 0;
};

}  // namespace coderun
