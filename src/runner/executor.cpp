#include "runner/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <time.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace coderun {
using namespace std;
namespace fs = std::filesystem;

executor::executor(runtime_provider &provider, const language_table &languages, const resource_limits &limits)
    : provider(provider), languages(languages), limits(limits) {
    this->limits.network_enabled = false;
}

void executor::register_history(unique_ptr<history> &&h) {
    histories.push_back(move(h));
}

execution_outcome executor::run(const source_unit &unit) {
    elapsed_time timer;
    execution_outcome outcome;
    try {
        outcome = visit(overloaded{
                            [this](const inline_code &code) { return run_inline(code); },
                            [this](const directory_entry &dir) { return run_directory(dir); }},
                        unit);
    } catch (unsupported_language &ex) {
        outcome = make_outcome(status::UNSUPPORTED_LANGUAGE, E_UNSUPPORTED_LANGUAGE, ex.what());
    } catch (entry_not_found &ex) {
        outcome = make_outcome(status::ENTRY_NOT_FOUND, E_ENTRY_NOT_FOUND, ex.what());
    } catch (coderun_exception &ex) {
        LOG(ERROR) << "Unable to run sandbox: " << ex;
        outcome = make_outcome(status::INTERNAL_FAILURE, E_INTERNAL_FAILURE, string("Internal failure: ") + ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to run sandbox: " << ex.what();
        outcome = make_outcome(status::INTERNAL_FAILURE, E_INTERNAL_FAILURE, string("Internal failure: ") + ex.what());
    } catch (...) {
        LOG(ERROR) << "Unable to run sandbox: unknown exception";
        outcome = make_outcome(status::INTERNAL_FAILURE, E_INTERNAL_FAILURE, "Internal failure: unknown error");
    }

    LOG(INFO) << "Run [" << language_of(unit) << "] finished with " << outcome.classification
              << ", exit code " << outcome.exit_code << ", "
              << timer.duration<chrono::milliseconds>().count() << "ms";

    report(unit, outcome);
    return outcome;
}

execution_outcome executor::run_inline(const inline_code &code) {
    // 必须在创建运行目录之前确认语言受支持，避免浪费资源
    const language &lang = languages.at(code.language);

    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path rundir = RUN_DIR / ("run-" + uuid);
    launch_spec spec = build_launch_spec(languages, code.language, lang.entry_filename, fs::absolute(rundir), limits);

    if (!fs::create_directories(rundir))
        throw internal_error("Run directory " + rundir.string() + " already exists");
    defer {
        // 无论运行成功、失败还是超时，运行目录都必须被删除
        error_code ec;
        fs::remove_all(rundir, ec);
        if (ec) LOG(WARNING) << "Unable to remove run directory " << rundir << ": " << ec.message();
    };

    fs::path entry = rundir / lang.entry_filename;
    write_file_content(entry, code.text);

    // 容器内的用户不一定和当前用户相同，运行目录必须对所有人可读
    fs::permissions(rundir,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);
    fs::permissions(entry,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);

    return launch(spec, lang);
}

execution_outcome executor::run_directory(const directory_entry &dir) {
    const language &lang = languages.at(dir.language);
    launch_spec spec = build_launch_spec(languages, dir.language, dir.entry, fs::absolute(dir.root_dir), limits);

    // 隔离环境看不到主机的文件系统结构，因此必须在主机上检查入口文件，不能相信调用方
    fs::path entry = dir.root_dir / dir.entry;
    if (!fs::is_regular_file(entry) || !is_inside_directory(dir.root_dir, entry))
        throw entry_not_found(dir.entry);

    return launch(spec, lang);
}

execution_outcome executor::launch(const launch_spec &spec, const language &lang) {
    provider_result result = provider.invoke(spec, limits.timeout);
    return classify(result, lang, limits.memory_bytes);
}

static string current_timestamp() {
    time_t now = time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

void executor::report(const source_unit &unit, const execution_outcome &outcome) {
    if (histories.empty()) return;

    history_record record;
    record.timestamp = current_timestamp();
    record.language = language_of(unit);
    record.code = visit(overloaded{
                            [](const inline_code &code) { return utf8_prefix(code.text, HISTORY_CODE_CHARS); },
                            [](const directory_entry &dir) {
                                string archive = dir.archive_name.empty() ? dir.root_dir.filename().string() : dir.archive_name;
                                return fmt::format("[zip run] {} (from {})", dir.entry, archive);
                            }},
                        unit);
    record.output = outcome.output;
    record.error = outcome.error;
    record.exit_code = outcome.exit_code;
    record.classification = outcome.classification;

    // 运行历史保存失败不能影响运行结果
    for (auto &h : histories) {
        try {
            h->append(record);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to save run history: " << ex.what();
        } catch (...) {
            LOG(ERROR) << "Unable to save run history: unknown exception";
        }
    }
}

}  // namespace coderun
