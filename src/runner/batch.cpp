#include "runner/batch.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <thread>
#include "common/concurrent_queue.hpp"

namespace coderun {
using namespace std;

vector<execution_outcome> run_batch(executor &exec, const vector<source_unit> &requests, size_t concurrency_limit) {
    vector<execution_outcome> results(requests.size());
    if (requests.empty()) return results;

    if (concurrency_limit == 0) {
        LOG(WARNING) << "Concurrency limit of batch is 0, running requests one by one";
        concurrency_limit = 1;
    }

    concurrent_queue<size_t> pending;
    for (size_t i = 0; i < requests.size(); ++i)
        pending.push(i);
    pending.close();

    size_t worker_count = min(concurrency_limit, requests.size());
    LOG(INFO) << "Running batch of " << requests.size() << " requests with " << worker_count << " workers";

    // 每个 worker 只写入自己取到的下标对应的位置，不需要额外的同步
    vector<thread> workers;
    for (size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back([&] {
            while (auto index = pending.pop())
                results[*index] = exec.run(requests[*index]);
        });
    }
    for (auto &worker : workers)
        worker.join();

    return results;
}

}  // namespace coderun
