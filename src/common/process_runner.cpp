#include "common/process_runner.hpp"
#include <unistd.h>      // POSIX
#include <sys/wait.h>    // waitpid
#include <poll.h>
#include <fcntl.h>
#include <signal.h>      // kill
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace std::chrono_literals;

namespace {

int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

void reap(pid_t pid, int& status) {
    pid_t ret = 0;
    do {
        ret = waitpid(pid, &status, 0);
    } while (ret == -1 && errno == EINTR);
}

} // namespace

std::string ProcessRunner::describe(const Options& opt) {
    return fmt::format("{} {}", opt.exe, fmt::join(opt.args, " "));
}

// ------------------------------------------------------------------
// 创建子进程，读取输出直到 EOF 或超时
ProcessRunner::Result ProcessRunner::run(const Options& opt) {
    if (opt.exe.empty()) {
        throw std::runtime_error("ProcessRunner: empty executable");
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(fmt::format("ProcessRunner: pipe failed: {}", strerror(errno)));
    }

    // 组装 argv 放在 fork 之前，子进程里只做 async-signal-safe 的事
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(opt.exe.c_str()));
    for (auto& s : opt.args) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {               // fork 失败
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::runtime_error(fmt::format("ProcessRunner: fork failed: {}", strerror(errno)));
    }

    if (pid == 0) {              // ---------- 子进程 ----------
        // 信号屏蔽字会跨 exec 继承，还原后子进程才能被 SIGTERM/SIGINT 结束
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        // execvp 只有失败才会返回
        _exit(127);
    }

    // ---------- 父进程 ----------
    ::close(fds[1]);
    spdlog::debug("ProcessRunner: started child {} [{}]", pid, describe(opt));

    Result result;
    const auto deadline = std::chrono::steady_clock::now() + opt.timeout.value_or(0ms);
    bool timed_out = false;
    char buf[4096];
    for (;;) {
        int wait_ms = -1;
        if (opt.timeout) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left <= 0ms) {
                timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left.count());
        }
        pollfd pfd{fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;   // 交给上面的超时判断
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;       // EOF：子进程关闭了输出
        result.output.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fds[0]);

    int status = 0;
    if (timed_out) {
        ::kill(pid, SIGKILL);
        reap(pid, status);
        spdlog::warn("ProcessRunner: child {} killed on timeout [{}]", pid, describe(opt));
        result.exit_code = -1;   // 自定义超时码
        return result;
    }

    reap(pid, status);
    result.exit_code = decode_status(status);
    if (result.exit_code == 127) {
        spdlog::warn("ProcessRunner: {} could not be executed", opt.exe);
    }
    spdlog::debug("ProcessRunner: child {} exited with {}", pid, result.exit_code);
    return result;
}
