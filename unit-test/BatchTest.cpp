#include <fstream>
#include <iterator>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "history/memory_history.hpp"
#include "runner/batch.hpp"
#include "test/fake_provider.hpp"

using namespace std;
using namespace coderun;

// 沙箱内执行的命令的最后一个参数是入口文件，这里用代码内容来区分不同的请求
static string staged_code(const launch_spec &spec) {
    ifstream fin(spec.mount_source / spec.command.back());
    return string(istreambuf_iterator<char>(fin), istreambuf_iterator<char>());
}

static vector<source_unit> make_requests(size_t n) {
    vector<source_unit> requests;
    for (size_t i = 0; i < n; ++i) {
        inline_code code;
        code.language = "python";
        code.text = to_string(i);
        requests.push_back(code);
    }
    return requests;
}

TEST(BatchTest, ResultsFollowRequestOrder) {
    // 越早提交的请求越晚完成
    fake_provider provider([](const launch_spec &spec) {
        int index = stoi(staged_code(spec));
        this_thread::sleep_for(chrono::milliseconds(50 * (4 - index)));
        return make_result(0, "result " + to_string(index));
    });
    executor exec(provider, language_table::defaults(), test_limits());

    vector<execution_outcome> results = run_batch(exec, make_requests(5), 5);
    ASSERT_EQ(results.size(), 5u);
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].classification, status::SUCCESS);
        EXPECT_EQ(results[i].output, "result " + to_string(i));
    }
}

TEST(BatchTest, ConcurrencyBounded) {
    fake_provider provider([](const launch_spec &) {
        this_thread::sleep_for(chrono::milliseconds(30));
        return make_result(0);
    });
    executor exec(provider, language_table::defaults(), test_limits());

    vector<execution_outcome> results = run_batch(exec, make_requests(8), 2);
    EXPECT_EQ(results.size(), 8u);
    EXPECT_EQ(provider.invocations(), 8u);
    EXPECT_LE(provider.max_in_flight(), 2u);
    EXPECT_GE(provider.max_in_flight(), 1u);
}

TEST(BatchTest, ZeroConcurrencyRunsOneByOne) {
    fake_provider provider([](const launch_spec &) {
        this_thread::sleep_for(chrono::milliseconds(10));
        return make_result(0);
    });
    executor exec(provider, language_table::defaults(), test_limits());

    vector<execution_outcome> results = run_batch(exec, make_requests(3), 0);
    EXPECT_EQ(results.size(), 3u);
    EXPECT_EQ(provider.invocations(), 3u);
    EXPECT_EQ(provider.max_in_flight(), 1u);
}

TEST(BatchTest, FailureIsolated) {
    fake_provider provider([](const launch_spec &spec) -> provider_result {
        string code = staged_code(spec);
        if (code == "1") throw provider_error("container crashed");
        if (code == "2") return make_result(137, "", "Killed");
        return make_result(0, code);
    });
    executor exec(provider, language_table::defaults(), test_limits());

    vector<source_unit> requests = make_requests(4);
    get<inline_code>(requests[3]).language = "cobol";

    vector<execution_outcome> results = run_batch(exec, requests, 4);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].classification, status::SUCCESS);
    EXPECT_EQ(results[0].output, "0");
    EXPECT_EQ(results[1].classification, status::INTERNAL_FAILURE);
    EXPECT_EQ(results[2].classification, status::RESOURCE_KILLED);
    EXPECT_EQ(results[3].classification, status::UNSUPPORTED_LANGUAGE);
    EXPECT_EQ(provider.invocations(), 3u);
    EXPECT_EQ(count_run_directories(), 0u);
}

TEST(BatchTest, EmptyBatch) {
    fake_provider provider([](const launch_spec &) { return make_result(0); });
    executor exec(provider, language_table::defaults(), test_limits());

    EXPECT_TRUE(run_batch(exec, {}, 5).empty());
    EXPECT_EQ(provider.invocations(), 0u);
}

TEST(BatchTest, SharedHistory) {
    fake_provider provider([](const launch_spec &) { return make_result(0); });
    executor exec(provider, language_table::defaults(), test_limits());
    auto h = make_unique<memory_history>(100);
    memory_history *recent = h.get();
    exec.register_history(move(h));

    run_batch(exec, make_requests(20), 5);
    EXPECT_EQ(recent->snapshot().size(), 20u);
}
