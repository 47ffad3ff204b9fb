#include <unistd.h>
#include <cstdlib>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "runner/docker.hpp"
#include "runner/executor.hpp"
#include "test/fake_provider.hpp"

using namespace std;
using namespace coderun;
namespace fs = std::filesystem;

static launch_spec python_spec(const fs::path &root) {
    return build_launch_spec(language_table::defaults(), "python", "user_code.py", root, test_limits());
}

TEST(DockerProviderTest, BuildArguments) {
    vector<string> args = docker_provider::build_arguments("docker", python_spec("/tmp/run-1"), "coderun-1");
    vector<string> expected = {"docker", "run", "--name", "coderun-1",
                               "--memory", "134217728", "--memory-swap", "134217728",
                               "--pids-limit", "64",
                               "--network", "none",
                               "--read-only",
                               "--mount", "type=bind,source=/tmp/run-1,target=/app,readonly",
                               "-w", "/app",
                               "python:3.11-slim", "python", "user_code.py"};
    EXPECT_EQ(args, expected);
}

TEST(DockerProviderTest, BuildArgumentsWithScratch) {
    launch_spec spec = python_spec("/srv/project");
    spec.scratch_dirs = {"/tmp"};
    spec.limits.proc_limit = 0;

    vector<string> args = docker_provider::build_arguments("/usr/bin/docker", spec, "coderun-2");
    vector<string> expected = {"/usr/bin/docker", "run", "--name", "coderun-2",
                               "--memory", "134217728", "--memory-swap", "134217728",
                               "--network", "none",
                               "--read-only",
                               "--tmpfs", "/tmp:rw,size=16m",
                               "--mount", "type=bind,source=/srv/project,target=/app,readonly",
                               "-w", "/app",
                               "python:3.11-slim", "python", "user_code.py"};
    EXPECT_EQ(args, expected);
}

TEST(DockerProviderTest, MountPathWithSeparators) {
    vector<string> args = docker_provider::build_arguments("docker", python_spec("/data/c:d/run-1"), "coderun-3");
    auto mount = find(args.begin(), args.end(), "--mount");
    ASSERT_NE(mount, args.end());
    EXPECT_EQ(*(mount + 1), "type=bind,source=/data/c:d/run-1,target=/app,readonly");

    args = docker_provider::build_arguments("docker", python_spec("/data/a,b \"q\""), "coderun-4");
    mount = find(args.begin(), args.end(), "--mount");
    ASSERT_NE(mount, args.end());
    EXPECT_EQ(*(mount + 1), "type=bind,\"source=/data/a,b \"\"q\"\"\",target=/app,readonly");
}

TEST(DockerProviderTest, MemoryLimitAlwaysEnforced) {
    launch_spec spec = python_spec("/tmp/run-1");
    spec.limits.memory_bytes = 0;
    EXPECT_THROW(docker_provider::build_arguments("docker", spec, "coderun-5"), provider_error);

    docker_provider provider("/nonexistent/docker", 1024);
    EXPECT_THROW(provider.invoke(spec, chrono::seconds(5)), provider_error);
}

/**
 * 用 shell 脚本模拟 docker 命令行，记录 rm 删除的容器
 */
class FakeDockerTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("coderun-docker-" + to_string(getpid()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        error_code ec;
        fs::remove_all(dir, ec);
    }

    string fake_docker(const string &run, const string &oom_killed = "false") {
        fs::path script = dir / "docker";
        write_file_content(script,
                           "#!/bin/sh\n"
                           "case \"$1\" in\n"
                           "run) " + run + " ;;\n"
                           "inspect) echo " + oom_killed + " ;;\n"
                           "rm) echo \"$3\" >> '" + (dir / "removed").string() + "' ;;\n"
                           "esac\n");
        fs::permissions(script, fs::perms::owner_all);
        return script.string();
    }

    vector<string> removed_containers() {
        vector<string> names;
        ifstream fin(dir / "removed");
        string line;
        while (getline(fin, line)) names.push_back(line);
        return names;
    }
};

TEST_F(FakeDockerTest, CapturesContainerOutput) {
    docker_provider provider(fake_docker("echo hello; echo warning >&2; exit 0"), 1024);
    provider_result result = provider.invoke(python_spec(dir), chrono::seconds(5));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_EQ(result.error, "warning\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.oom_killed);

    vector<string> removed = removed_containers();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].rfind("coderun-", 0), 0u);
}

TEST_F(FakeDockerTest, ReportsOomKilled) {
    docker_provider provider(fake_docker("exit 137", "true"), 1024);
    provider_result result = provider.invoke(python_spec(dir), chrono::seconds(5));

    EXPECT_EQ(result.exit_code, 137);
    EXPECT_TRUE(result.oom_killed);
}

TEST_F(FakeDockerTest, TimeoutRemovesContainer) {
    docker_provider provider(fake_docker("echo started; sleep 30"), 1024);
    auto start = chrono::steady_clock::now();
    provider_result result = provider.invoke(python_spec(dir), chrono::seconds(1));

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(10));
    EXPECT_EQ(removed_containers().size(), 1u);
}

TEST_F(FakeDockerTest, DockerFailureRaisesProviderError) {
    docker_provider provider(fake_docker("echo 'Unable to find image' >&2; exit 125"), 1024);
    EXPECT_THROW(provider.invoke(python_spec(dir), chrono::seconds(5)), provider_error);
    EXPECT_EQ(removed_containers().size(), 1u);
}

TEST_F(FakeDockerTest, ExecutorReportsDockerFailure) {
    docker_provider provider(fake_docker("exit 125"), 1024);
    executor exec(provider, language_table::defaults(), test_limits());

    inline_code code;
    code.language = "python";
    code.text = "print(1)\n";
    execution_outcome outcome = exec.run(code);
    EXPECT_EQ(outcome.classification, status::INTERNAL_FAILURE);
    EXPECT_EQ(outcome.exit_code, -4);
}

TEST(DockerProviderTest, MissingDockerBinary) {
    docker_provider provider("/nonexistent/docker", 1024);
    EXPECT_THROW(provider.invoke(python_spec("/tmp"), chrono::seconds(5)), system_error);
}

/**
 * 以下测试需要本机可以运行 docker 并且已经拉取 python:3.11-slim 镜像
 */
class DockerEndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!getenv("CODERUN_DOCKER_TESTS"))
            GTEST_SKIP() << "CODERUN_DOCKER_TESTS is not set";
    }

    execution_outcome run_python(const string &text) {
        docker_provider provider("docker", 1 << 20);
        executor exec(provider, language_table::defaults(), test_limits());
        inline_code code;
        code.language = "python";
        code.text = text;
        return exec.run(code);
    }
};

TEST_F(DockerEndToEndTest, HelloWorld) {
    execution_outcome outcome = run_python("print('hello')\n");
    EXPECT_EQ(outcome.classification, status::SUCCESS);
    EXPECT_EQ(outcome.output, "hello\n");
}

TEST_F(DockerEndToEndTest, RuntimeError) {
    execution_outcome outcome = run_python("1 / 0\n");
    EXPECT_EQ(outcome.classification, status::RUNTIME_ERROR);
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_NE(outcome.error.find("ZeroDivisionError"), string::npos);
}

TEST_F(DockerEndToEndTest, NetworkDisabled) {
    execution_outcome outcome = run_python("import socket\nsocket.create_connection(('1.1.1.1', 53), timeout=2)\n");
    EXPECT_EQ(outcome.classification, status::RUNTIME_ERROR);
}

TEST_F(DockerEndToEndTest, FilesystemReadOnly) {
    execution_outcome outcome = run_python("open('/app/new.txt', 'w').write('x')\n");
    EXPECT_EQ(outcome.classification, status::RUNTIME_ERROR);
}
