#pragma once

#include <deque>
#include <mutex>
#include <vector>
#include "history/history.hpp"

namespace coderun {

/**
 * @brief 保存在内存中的最近运行历史
 * 最新的记录在最前面，超过容量后丢弃最旧的记录。
 */
struct memory_history : public history {
    /**
     * @param capacity 最多保留多少条记录，默认为 MAX_HISTORY
     */
    explicit memory_history(std::size_t capacity);

    void append(const history_record &record) override;

    /**
     * @brief 获得当前所有记录的拷贝，最新的记录在最前面
     */
    std::vector<history_record> snapshot() const;

private:
    std::size_t capacity;
    mutable std::mutex mut;
    std::deque<history_record> records;
};

}  // namespace coderun
