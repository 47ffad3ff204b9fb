#include "runner/outcome.hpp"
#include <fmt/core.h>
#include "common/stl_utils.hpp"

namespace coderun {
using namespace std;

const vector<string> KILL_MARKERS = {"Killed", "OOM"};

string format_memory(int64_t bytes) {
    if (bytes > 0 && bytes % (1ll << 30) == 0) return fmt::format("{}g", bytes >> 30);
    if (bytes > 0 && bytes % (1ll << 20) == 0) return fmt::format("{}m", bytes >> 20);
    if (bytes > 0 && bytes % (1ll << 10) == 0) return fmt::format("{}k", bytes >> 10);
    return fmt::format("{}b", bytes);
}

string resource_killed_message(int64_t memory_bytes) {
    return fmt::format("Process killed (likely out of memory > {}).", format_memory(memory_bytes));
}

execution_outcome classify(const provider_result &result, const language &lang, int64_t memory_bytes) {
    execution_outcome outcome;
    if (result.timed_out) {
        outcome.classification = status::TIMED_OUT;
        outcome.exit_code = E_TIMED_OUT;
        outcome.output = result.output;
        outcome.error = result.error;
        return outcome;
    }

    // 优先使用隔离环境给出的结构化信号，其次是 137 退出码，最后才匹配 stderr 文本
    if (result.oom_killed || result.exit_code == E_RESOURCE_KILLED || contains_any(result.error, KILL_MARKERS)) {
        outcome.classification = status::RESOURCE_KILLED;
        outcome.exit_code = E_RESOURCE_KILLED;
        outcome.error = resource_killed_message(memory_bytes);
        return outcome;
    }

    if (!lang.oom_marker.empty() && result.error.find(lang.oom_marker) != string::npos) {
        // 程序自己观察到了内存分配失败，返回程序自己的错误信息
        outcome.classification = status::RUNTIME_ERROR;
        outcome.exit_code = result.exit_code;
        outcome.error = result.error;
        return outcome;
    }

    outcome.classification = result.exit_code == 0 ? status::SUCCESS : status::RUNTIME_ERROR;
    outcome.exit_code = result.exit_code;
    outcome.output = result.output;
    outcome.error = result.error;
    return outcome;
}

execution_outcome make_outcome(status classification, int exit_code, const string &error) {
    execution_outcome outcome;
    outcome.classification = classification;
    outcome.exit_code = exit_code;
    outcome.error = error;
    return outcome;
}

void to_json(nlohmann::json &j, const execution_outcome &outcome) {
    j = {{"output", outcome.output},
         {"error", outcome.error},
         {"exit_code", outcome.exit_code},
         {"status", get_display_message(outcome.classification)}};
}

}  // namespace coderun
