#include "runner/docker.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;

// docker 客户端自身出错（daemon 不可用、镜像不存在等）时的退出码
static const int DOCKER_CLI_FAILURE = 125;

// inspect、rm 等管理命令的时间限制
static const chrono::seconds ADMIN_TIMEOUT(30);

static const char *const SCRATCH_OPTIONS = ":rw,size=16m";

/**
 * --mount 的参数按 CSV 解析，值中含有逗号或者引号时整个字段需要用引号括起来
 */
static string mount_field(const string &key, const string &value) {
    string field = key + "=" + value;
    if (field.find_first_of(",\"") == string::npos) return field;
    string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

docker_provider::docker_provider(const string &docker, int64_t output_limit)
    : docker(docker), output_limit(output_limit) {}

vector<string> docker_provider::build_arguments(const string &docker, const launch_spec &spec, const string &container_name) {
    // docker 把 --memory 0 视为不限制内存
    if (spec.limits.memory_bytes <= 0)
        throw provider_error("Refusing to start a sandbox without memory limit");

    vector<string> args = {docker, "run", "--name", container_name};
    // memory-swap 与 memory 相同表示禁止使用 swap
    args.insert(args.end(), {"--memory", to_string(spec.limits.memory_bytes),
                             "--memory-swap", to_string(spec.limits.memory_bytes)});
    if (spec.limits.proc_limit > 0) {
        args.insert(args.end(), {"--pids-limit", to_string(spec.limits.proc_limit)});
    }
    if (!spec.limits.network_enabled) {
        args.insert(args.end(), {"--network", "none"});
    }
    args.push_back("--read-only");
    for (auto &scratch : spec.scratch_dirs) {
        args.insert(args.end(), {"--tmpfs", scratch + SCRATCH_OPTIONS});
    }
    // -v 使用冒号分隔路径，路径本身含有冒号时会被错误解析，因此使用 --mount
    args.insert(args.end(), {"--mount", "type=bind," + mount_field("source", spec.mount_source.string()) + "," +
                                            mount_field("target", spec.working_dir) + ",readonly",
                             "-w", spec.working_dir,
                             spec.image});
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

provider_result docker_provider::invoke(const launch_spec &spec, chrono::seconds deadline) {
    string container_name = "coderun-" + boost::lexical_cast<string>(boost::uuids::random_generator()());

    vector<string> args = build_arguments(docker, spec, container_name);

    defer {
        remove_container(container_name);
    };

    process_result process = exec_capture(args, deadline, output_limit);

    if (!process.timed_out && process.exit_code == DOCKER_CLI_FAILURE) {
        string message = boost::algorithm::trim_copy(process.error);
        throw provider_error("docker run failed: " + (message.empty() ? string("exit code 125") : message));
    }

    provider_result result;
    result.output = move(process.output);
    result.error = move(process.error);
    result.exit_code = process.exit_code;
    result.timed_out = process.timed_out;
    if (!result.timed_out) result.oom_killed = inspect_oom_killed(container_name);
    return result;
}

bool docker_provider::inspect_oom_killed(const string &container_name) {
    try {
        process_result inspect = exec_capture({docker, "inspect", "--format", "{{.State.OOMKilled}}", container_name},
                                              ADMIN_TIMEOUT, 1024);
        if (inspect.timed_out || inspect.exit_code != 0) {
            LOG(WARNING) << "Unable to inspect container " << container_name << ": " << inspect.error;
            return false;
        }
        return boost::algorithm::trim_copy(inspect.output) == "true";
    } catch (std::system_error &ex) {
        LOG(WARNING) << "Unable to inspect container " << container_name << ": " << ex.what();
        return false;
    }
}

void docker_provider::remove_container(const string &container_name) {
    process_result rm = exec_capture({docker, "rm", "-f", container_name}, ADMIN_TIMEOUT, 1024);
    if (rm.timed_out || rm.exit_code != 0) {
        LOG(WARNING) << "Unable to remove container " << container_name << ": " << rm.error;
    }
}

}  // namespace coderun
