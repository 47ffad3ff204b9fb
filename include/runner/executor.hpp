#pragma once

#include <memory>
#include <vector>
#include "history/history.hpp"
#include "runner/language.hpp"
#include "runner/launch_spec.hpp"
#include "runner/outcome.hpp"
#include "runner/provider.hpp"
#include "runner/source_unit.hpp"

namespace coderun {

/**
 * @brief 负责单次运行的完整生命周期
 * 准备代码 -> 构造沙箱调用描述 -> 在时钟时间限制下调用隔离环境 -> 收集输出和退出码 -> 分类。
 *
 * executor 在所有运行之间共享（批量运行时被多个 worker 同时调用），
 * 它只持有只读的状态：语言表、资源限制快照和隔离环境的引用。
 * 运行历史的存储必须在第一次运行之前注册完成。
 */
struct executor {
    /**
     * @param provider 隔离运行环境，生命周期必须长于 executor
     * @param languages 支持的语言表
     * @param limits 资源限制，默认为 make_resource_limits() 的快照
     */
    executor(runtime_provider &provider, const language_table &languages, const resource_limits &limits = make_resource_limits());

    /**
     * @brief 执行一次运行
     * 每次调用恰好产生一个运行结果，所有失败都以分类结果的形式返回，不会抛出异常。
     * 内联代码的运行目录在任何退出路径下都会被删除。
     * @param unit 运行输入
     * @return 运行结果
     */
    execution_outcome run(const source_unit &unit);

    /**
     * @brief 注册运行历史的存储
     * 每次运行结束后，executor 会把运行记录交给所有注册的存储。
     */
    void register_history(std::unique_ptr<history> &&h);

private:
    execution_outcome run_inline(const inline_code &code);

    execution_outcome run_directory(const directory_entry &dir);

    execution_outcome launch(const launch_spec &spec, const language &lang);

    void report(const source_unit &unit, const execution_outcome &outcome);

    runtime_provider &provider;
    language_table languages;
    resource_limits limits;
    std::vector<std::unique_ptr<history>> histories;
};

}  // namespace coderun
