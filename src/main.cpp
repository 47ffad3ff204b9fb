#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "history/file_history.hpp"
#include "history/memory_history.hpp"
#include "runner/archive.hpp"
#include "runner/batch.hpp"
#include "runner/docker.hpp"
#include "runner/executor.hpp"
using namespace std;

namespace po = boost::program_options;

/**
 * @brief 命令行参数优先，其次是环境变量，都没有时保持默认值
 * @return 是否从命令行参数或者环境变量中读到了值
 */
template <typename T>
static bool load_setting(const po::variables_map &vm, const char *option, const char *env, T &target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
        return true;
    } else if (getenv(env)) {
        target = boost::lexical_cast<T>(getenv(env));
        return true;
    }
    return false;
}

static void check_code(const string &code) {
    if (boost::algorithm::trim_copy(code).empty())
        throw invalid_argument("Code cannot be empty");
    if (coderun::utf8_length(code) > coderun::MAX_CODE_CHARS)
        throw invalid_argument("Code exceeds maximum length of " + to_string(coderun::MAX_CODE_CHARS) + " characters");
}

static vector<coderun::source_unit> read_batch(const filesystem::path &path) {
    nlohmann::json j = nlohmann::json::parse(coderun::read_file_content(path));
    if (!j.is_object() || !j.contains("tasks") || !j.at("tasks").is_array())
        throw invalid_argument("Batch file should contain an array named tasks");

    vector<coderun::source_unit> requests;
    for (auto &task : j.at("tasks")) {
        if (!task.is_object() || !task.contains("code") || !task.at("code").is_string())
            throw invalid_argument("Every task should contain a string named code");
        coderun::inline_code code;
        code.text = task.at("code").get<string>();
        code.language = nlohmann::get_value_def<string>(task, "python", "language");
        check_code(code.text);
        requests.push_back(code);
    }
    if (requests.empty())
        throw invalid_argument("Batch should contain at least one task");
    return requests;
}

static void print_json(const nlohmann::json &j) {
    // 沙箱内程序的输出不一定是合法的 UTF-8，非法字节替换为 U+FFFD 而不是拒绝输出
    cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("coderun options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("file", po::value<string>(), "run the code in given file, or read code from stdin if - is given")
        ("batch", po::value<string>(), "run all tasks in given JSON file concurrently, with format {\"tasks\": [{\"code\": \"...\", \"language\": \"python\"}]}")
        ("dir", po::value<string>(), "run a multi-file project in given extracted directory, --entry is required")
        ("entry", po::value<string>(), "set the entry file of --dir, relative to the directory")
        ("archive-name", po::value<string>(), "set the archive name of --dir recorded in run history")
        ("language", po::value<string>()->default_value("python"), "set the language of the code")
        ("languages", po::value<string>(), "load supported languages from given JSON file instead of the built-in table")
        ("history", po::value<string>(), "append every run to given JSON Lines file")
        ("show-history", "print the run history after the runs, or the history stored in --history if nothing to run")
        ("memory-limit", po::value<int64_t>(), "set memory limit in KB for each sandbox, default to 131072(128MB). You can either pass it from environ MEMLIMIT")
        ("time-limit", po::value<int>(), "set time limit in seconds for each run, default to 10(10 seconds). You can either pass it from environ TIMELIMIT")
        ("proc-limit", po::value<int>(), "set the maximum number of processes in each sandbox, default to 64. You can either pass it from environ PROCLIMIT")
        ("output-limit", po::value<int64_t>(), "set output limit in KB for stdout and stderr respectively, default to 1024(1MB). You can either pass it from environ OUTPUTLIMIT")
        ("concurrency", po::value<int64_t>(), "set the maximum number of sandboxes running simultaneously in a batch, default to 5. You can either pass it from environ CONCURRENCY")
        ("max-code-chars", po::value<size_t>(), "set the maximum length of submitted code, default to 5000. You can either pass it from environ MAXCODECHARS")
        ("max-history", po::value<size_t>(), "set the number of runs kept in history, default to 100. You can either pass it from environ MAXHISTORY")
        ("run-dir", po::value<string>(), "set the directory to stage submitted code. You can either pass it from environ RUNDIR")
        ("docker", po::value<string>(), "set the docker executable. You can either pass it from environ DOCKER")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);

        int64_t memory_limit_kb;
        if (load_setting(vm, "memory-limit", "MEMLIMIT", memory_limit_kb))
            coderun::MEMORY_LIMIT = coderun::kilobytes_to_bytes(memory_limit_kb, "Memory limit");
        int64_t output_limit_kb;
        if (load_setting(vm, "output-limit", "OUTPUTLIMIT", output_limit_kb))
            coderun::OUTPUT_LIMIT = coderun::kilobytes_to_bytes(output_limit_kb, "Output limit");
        load_setting(vm, "time-limit", "TIMELIMIT", coderun::TIME_LIMIT);
        load_setting(vm, "proc-limit", "PROCLIMIT", coderun::PROC_LIMIT);
        // 以有符号数读取，避免负数被 lexical_cast 转换为很大的无符号数
        int64_t concurrency;
        if (load_setting(vm, "concurrency", "CONCURRENCY", concurrency)) {
            if (concurrency <= 0)
                throw invalid_argument("Concurrency should be positive");
            coderun::MAX_CONCURRENCY = (size_t)concurrency;
        }
        load_setting(vm, "max-code-chars", "MAXCODECHARS", coderun::MAX_CODE_CHARS);
        load_setting(vm, "max-history", "MAXHISTORY", coderun::MAX_HISTORY);
        load_setting(vm, "docker", "DOCKER", coderun::DOCKER);
        string run_dir;
        if (load_setting(vm, "run-dir", "RUNDIR", run_dir))
            coderun::RUN_DIR = run_dir;

        coderun::check_settings();
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (invalid_argument &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "coderun: Run untrusted code snippets in isolated docker containers" << endl
             << "Results are printed in JSON format to stdout, logs are written to stderr" << endl
             << "Usage: " << argv[0] << " (--file <path> | --batch <tasks.json> | --dir <root> --entry <path>) [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "coderun 1.0" << endl;
        return EXIT_SUCCESS;
    }

    size_t modes = vm.count("file") + vm.count("batch") + vm.count("dir");
    if (modes > 1 || (modes == 0 && !vm.count("show-history"))) {
        cerr << "Exactly one of --file, --batch and --dir should be specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("dir") && !vm.count("entry")) {
        cerr << "--entry is required by --dir" << endl;
        return EXIT_FAILURE;
    }


    // 只显示持久化的运行历史
    if (modes == 0) {
        if (!vm.count("history")) {
            cerr << "--show-history requires --history when there is nothing to run" << endl;
            return EXIT_FAILURE;
        }
        coderun::file_history stored(vm.at("history").as<string>());
        vector<coderun::history_record> records = stored.read_all();
        // 与内存中的运行历史保持一致，最新的记录在前
        reverse(records.begin(), records.end());
        if (records.size() > coderun::MAX_HISTORY) records.resize(coderun::MAX_HISTORY);
        print_json({{"history", records}});
        return EXIT_SUCCESS;
    }

    CHECK(filesystem::is_directory(coderun::RUN_DIR))
        << "Run directory " << coderun::RUN_DIR << " does not exist";

    coderun::language_table languages = coderun::language_table::defaults();
    if (vm.count("languages")) {
        filesystem::path path = vm.at("languages").as<string>();
        CHECK(filesystem::is_regular_file(path))
            << "Language table file " << path << " does not exist";
        try {
            languages = coderun::language_table::load(path);
        } catch (std::exception &e) {
            LOG(FATAL) << "Language table file " << path << " is malformed: " << e.what();
        }
    }

    coderun::docker_provider provider(coderun::DOCKER, coderun::OUTPUT_LIMIT);
    coderun::executor exec(provider, languages);

    coderun::memory_history *recent = nullptr;
    if (vm.count("show-history")) {
        auto memory = make_unique<coderun::memory_history>(coderun::MAX_HISTORY);
        recent = memory.get();
        exec.register_history(move(memory));
    }
    if (vm.count("history")) {
        exec.register_history(make_unique<coderun::file_history>(vm.at("history").as<string>()));
    }

    string language = vm.at("language").as<string>();

    try {
        if (vm.count("file")) {
            string path = vm.at("file").as<string>();
            coderun::inline_code code;
            code.language = language;
            if (path == "-") {
                code.text.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
            } else {
                if (!filesystem::is_regular_file(path)) {
                    cerr << "File " << path << " does not exist" << endl;
                    return EXIT_FAILURE;
                }
                code.text = coderun::read_file_content(path);
            }
            check_code(code.text);
            print_json(exec.run(code));
        } else if (vm.count("batch")) {
            vector<coderun::source_unit> requests = read_batch(vm.at("batch").as<string>());
            vector<coderun::execution_outcome> results = coderun::run_batch(exec, requests, coderun::MAX_CONCURRENCY);
            print_json({{"results", results}});
        } else {
            string archive_name = vm.count("archive-name") ? vm.at("archive-name").as<string>() : "";
            print_json(coderun::run_from_directory(exec, vm.at("entry").as<string>(), language,
                                                   vm.at("dir").as<string>(), archive_name));
        }
    } catch (invalid_argument &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (nlohmann::json::exception &e) {
        cerr << "Malformed batch file: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (system_error &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (recent) {
        print_json({{"history", recent->snapshot()}});
    }

    return 0;
}
