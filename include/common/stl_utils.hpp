#pragma once

#include <string>
#include <vector>

namespace coderun {

/**
 * @brief 检查 str 是否包含 needles 中的任意一个子串（区分大小写）
 */
inline bool contains_any(const std::string &str, const std::vector<std::string> &needles) {
    for (auto &needle : needles)
        if (!needle.empty() && str.find(needle) != std::string::npos)
            return true;
    return false;
}

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace coderun
