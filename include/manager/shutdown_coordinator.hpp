#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <functional>
#include <mutex>
#include <signal.h>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/stop_token.hpp"

/*==========================================================
 * 停机协调器
 *
 * Running -> ShuttingDown -> Stopped，单向。
 * SIGINT / SIGTERM 经 signalfd 进入 epoll 线程，触发一次广播停止；
 * finish() 等待所有 worker 退出后按注册顺序执行清理。
 *=========================================================*/
class ShutdownCoordinator {
public:
    enum class State { Running, ShuttingDown, Stopped };

    ShutdownCoordinator();
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&)            = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    // 在调用线程屏蔽 SIGINT/SIGTERM 并启动信号线程；需在创建其它线程前调用
    void arm();
    bool armed() const { return signal_fd_ >= 0; }

    // 进入 ShuttingDown，仅第一次返回 true；之后只记日志
    bool trigger(int signo);

    StopToken token() const { return root_.token(); }

    // 启动 worker；进入 ShuttingDown 后拒绝并返回 false
    bool spawn(std::string name, std::function<void(const StopToken&)> fn);

    // finish() 时按注册顺序执行
    void add_teardown(std::string name, std::function<void()> fn);

    // 阻塞直到进入 ShuttingDown
    void wait() const;

    // 停止、回收 worker、执行清理，进入 Stopped；可重复调用
    void finish();

    State state() const;
    std::size_t spawned_count() const;
    int signals_received() const { return signals_received_.load(); }

private:
    bool begin_shutdown(int signo);
    void signal_loop();
    void disarm();

    StopSource                 root_;

    mutable std::mutex         mtx_;
    State                      state_ = State::Running;
    std::size_t                spawned_ = 0;
    std::vector<std::pair<std::string, std::thread>>            workers_;
    std::vector<std::pair<std::string, std::function<void()>>>  teardowns_;

    // 信号捕获
    int                        signal_fd_ = -1;
    int                        epoll_fd_  = -1;
    sigset_t                   old_mask_{};
    std::atomic<bool>          signal_running_{false};
    std::thread                signal_thread_;
    std::atomic<int>           signals_received_{0};
};

const char* to_string(ShutdownCoordinator::State state);
