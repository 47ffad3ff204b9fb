#pragma once

#include <filesystem>
#include <mutex>
#include <vector>
#include "history/history.hpp"

namespace coderun {

/**
 * @brief 持久化的运行历史
 * 每条记录以一行 JSON 的形式追加到文件末尾（JSON Lines），
 * 文件只追加不修改，可以直接用 jq 等工具查看。
 */
struct file_history : public history {
    /**
     * @param path 历史文件路径，不存在时会在第一次追加时创建
     */
    explicit file_history(const std::filesystem::path &path);

    /**
     * @brief 追加一条记录
     * @throw std::system_error 若文件无法打开或写入失败
     */
    void append(const history_record &record) override;

    /**
     * @brief 读取文件中的全部记录，按写入顺序排列
     * 无法解析的行会被跳过并记录警告
     */
    std::vector<history_record> read_all() const;

private:
    std::filesystem::path path;
    mutable std::mutex mut;
};

}  // namespace coderun
