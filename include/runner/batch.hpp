#pragma once

#include <cstddef>
#include <vector>
#include "runner/executor.hpp"

namespace coderun {

/**
 * @brief 批量运行一组互不相关的请求
 * 固定数量的 worker 线程从共享队列中取出请求下标并调用 executor，
 * 同时进行的运行（也就是同时存在的沙箱）不会超过 concurrency_limit 个。
 * 某个请求失败不会取消或者影响其他请求。
 *
 * @param exec 所有 worker 共享的 executor
 * @param requests 请求列表
 * @param concurrency_limit 并发上限，0 视为 1
 * @return 与 requests 一一对应的运行结果，顺序与请求顺序相同，与完成顺序无关
 */
std::vector<execution_outcome> run_batch(executor &exec, const std::vector<source_unit> &requests, std::size_t concurrency_limit);

}  // namespace coderun
