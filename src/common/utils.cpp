#include "common/utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <sstream>
#include <system_error>
#include "common/defer.hpp"

namespace coderun {
using namespace std;

const char *const TRUNCATION_NOTICE = "\n[output truncated]";

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void append_limited(string &buffer, bool &truncated, const char *data, size_t length, int64_t limit) {
    if (truncated) return;
    if (limit < 0 || buffer.size() + length <= (size_t)limit) {
        buffer.append(data, length);
        return;
    }
    buffer.append(data, (size_t)limit - min(buffer.size(), (size_t)limit));
    buffer += TRUNCATION_NOTICE;
    truncated = true;
}

process_result exec_capture(const vector<string> &args, chrono::milliseconds timeout, int64_t output_limit) {
    if (args.empty()) throw invalid_argument("exec_capture requires a program to run");

    // argv 必须在 fork 之前准备好，子进程中只能调用 async-signal-safe 的函数
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

#ifndef NDEBUG
    stringstream ss;
    for (auto &arg : args) ss << arg << ' ';
    LOG(INFO) << ss.str();
#endif

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    defer {
        close_fd(out_pipe[0]), close_fd(out_pipe[1]);
        close_fd(err_pipe[0]), close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]), close_fd(exec_pipe[1]);
    };
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0)
        throw system_error(errno, system_category(), "pipe");

    pid_t pid = fork();
    if (pid < 0) throw system_error(errno, system_category(), "fork");

    if (pid == 0) {  // 子进程
        // 子进程独占一个进程组，超时时可以通过 killpg 杀死它创建的所有进程
        setpgid(0, 0);
        // 避免终端的 Ctrl-C 直接杀死子进程，要求父进程处理中断信号
        signal(SIGINT, SIG_IGN);
        signal(SIGPIPE, SIG_DFL);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        // exec 失败，通过 exec_pipe 把 errno 告诉父进程
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // 父进程
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    while ((n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR)
        ;
    if (n == (ssize_t)sizeof(exec_errno)) {
        int status;
        waitpid(pid, &status, 0);
        throw system_error(exec_errno, system_category(), "unable to execute " + args[0]);
    }

    process_result result;
    bool out_truncated = false, err_truncated = false;
    bool exited = false;
    int status = 0;
    auto deadline = chrono::steady_clock::now() + timeout;
    char buffer[4096];

    while (true) {
        if (!exited) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                exited = true;
                // 子进程已经退出，但它的后代可能仍然持有管道，这些后代进程不允许存活
                if (out_pipe[0] >= 0 || err_pipe[0] >= 0) killpg(pid, SIGKILL);
            }
        }
        if (exited && out_pipe[0] < 0 && err_pipe[0] < 0) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }

        // 最多等待 50ms，以便及时发现子进程退出但管道没有关闭的情况
        int wait_ms = (int)min<int64_t>(chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1, 50);
        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_pipe[0] >= 0) fds[nfds++] = {out_pipe[0], POLLIN, 0};
        if (err_pipe[0] >= 0) fds[nfds++] = {err_pipe[0], POLLIN, 0};
        if (nfds == 0) {
            usleep(wait_ms * 1000);
            continue;
        }

        int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            killpg(pid, SIGKILL);
            waitpid(pid, &status, 0);
            throw system_error(err, system_category(), "poll");
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool is_out = fds[i].fd == out_pipe[0];
            ssize_t len = read(fds[i].fd, buffer, sizeof(buffer));
            if (len > 0) {
                if (is_out)
                    append_limited(result.output, out_truncated, buffer, len, output_limit);
                else
                    append_limited(result.error, err_truncated, buffer, len, output_limit);
            } else if (len == 0 || errno != EINTR) {
                close_fd(is_out ? out_pipe[0] : err_pipe[0]);
            }
        }
    }

    if (result.timed_out) {
        killpg(pid, SIGKILL);
        if (!exited) waitpid(pid, &status, 0);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }
    return result;
}

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

size_t utf8_length(const string &text) {
    size_t count = 0;
    for (unsigned char c : text)
        if (!is_continuation(c)) ++count;
    return count;
}

string utf8_prefix(const string &text, size_t max_chars) {
    size_t count = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (is_continuation(text[i])) continue;
        if (count++ == max_chars) return text.substr(0, i);
    }
    return text;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace coderun
