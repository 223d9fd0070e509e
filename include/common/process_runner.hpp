#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// 外部命令执行器：ip / tc / arping / gobgp 都经由这里调用
class ProcessRunner {
public:
    // 配置结构体，便于将来扩展
    struct Options {
        std::string              exe;      // 可执行文件，按 PATH 查找
        std::vector<std::string> args;     // 传给子进程的命令行参数
        std::optional<std::chrono::milliseconds> timeout; // 可选超时，超时后 SIGKILL
    };

    struct Result {
        int         exit_code = -1;  // 正常退出码；被信号杀死为 128+signo
        std::string output;          // stdout + stderr
        bool ok() const { return exit_code == 0; }
    };

    virtual ~ProcessRunner() = default;

    // 同步执行，fork/exec 失败抛 std::runtime_error
    virtual Result run(const Options& opt);

    static std::string describe(const Options& opt);
};
