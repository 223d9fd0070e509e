#include "manager/shutdown_coordinator.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <fmt/core.h>

const char* to_string(ShutdownCoordinator::State state) {
    switch (state) {
        case ShutdownCoordinator::State::Running:      return "running";
        case ShutdownCoordinator::State::ShuttingDown: return "shutting_down";
        case ShutdownCoordinator::State::Stopped:      return "stopped";
    }
    return "unknown";
}

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::~ShutdownCoordinator() {
    finish();
    disarm();
}

/*------------------------------------------------------
 * 信号捕获
 *----------------------------------------------------*/
void ShutdownCoordinator::arm() {
    if (armed()) return;

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &mask, &old_mask_) != 0) {
        throw std::runtime_error("ShutdownCoordinator: pthread_sigmask failed");
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        int err = errno;
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
        throw std::runtime_error(fmt::format("ShutdownCoordinator: signalfd: {}", strerror(err)));
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        int err = errno;
        disarm();
        throw std::runtime_error(fmt::format("ShutdownCoordinator: epoll_create1: {}", strerror(err)));
    }
    epoll_event ev{};
    ev.events  = EPOLLIN;
    ev.data.fd = signal_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, signal_fd_, &ev) < 0) {
        int err = errno;
        disarm();
        throw std::runtime_error(fmt::format("ShutdownCoordinator: epoll_ctl: {}", strerror(err)));
    }

    signal_running_ = true;
    signal_thread_  = std::thread(&ShutdownCoordinator::signal_loop, this);
    spdlog::debug("ShutdownCoordinator: capturing SIGINT and SIGTERM");
}

void ShutdownCoordinator::signal_loop() {
    constexpr int max_events = 4;
    epoll_event events[max_events];
    while (signal_running_) {
        int nf = epoll_wait(epoll_fd_, events, max_events, 200);
        if (nf < 0) {
            if (errno == EINTR) continue;
            spdlog::error("ShutdownCoordinator: epoll_wait error {}", strerror(errno));
            break;
        }
        for (int i = 0; i < nf; ++i) {
            signalfd_siginfo info{};
            while (read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                trigger(static_cast<int>(info.ssi_signo));
            }
        }
    }
}

void ShutdownCoordinator::disarm() {
    signal_running_ = false;
    if (signal_thread_.joinable()) signal_thread_.join();

    if (signal_fd_ >= 0) {
        // 取走未处理的信号，恢复屏蔽字后不会再投递
        signalfd_siginfo info{};
        while (read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
            spdlog::debug("ShutdownCoordinator: drained pending signal {}", info.ssi_signo);
        }
        ::close(signal_fd_);
        signal_fd_ = -1;
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
}

/*------------------------------------------------------
 * 状态迁移
 *----------------------------------------------------*/
bool ShutdownCoordinator::trigger(int signo) {
    ++signals_received_;
    return begin_shutdown(signo);
}

bool ShutdownCoordinator::begin_shutdown(int signo) {
    {
        std::lock_guard<std::mutex> lg(mtx_);
        if (state_ != State::Running) {
            spdlog::info("ShutdownCoordinator: received signal {} while {}, ignoring", signo, to_string(state_));
            return false;
        }
        state_ = State::ShuttingDown;
    }
    if (signo > 0) {
        spdlog::info("ShutdownCoordinator: received {}, shutting down", strsignal(signo));
    } else {
        spdlog::info("ShutdownCoordinator: shutdown requested");
    }
    root_.request_stop();
    return true;
}

bool ShutdownCoordinator::spawn(std::string name, std::function<void(const StopToken&)> fn) {
    std::lock_guard<std::mutex> lg(mtx_);
    if (state_ != State::Running) {
        spdlog::warn("ShutdownCoordinator: refusing to start worker {} after shutdown began", name);
        return false;
    }
    StopToken token = root_.token();
    std::thread t([name, fn = std::move(fn), token] {
        try {
            fn(token);
        } catch (const std::exception& e) {
            spdlog::error("ShutdownCoordinator: worker {} failed: {}", name, e.what());
        }
    });
    workers_.emplace_back(std::move(name), std::move(t));
    ++spawned_;
    return true;
}

void ShutdownCoordinator::add_teardown(std::string name, std::function<void()> fn) {
    std::lock_guard<std::mutex> lg(mtx_);
    teardowns_.emplace_back(std::move(name), std::move(fn));
}

void ShutdownCoordinator::wait() const {
    root_.token().wait();
}

void ShutdownCoordinator::finish() {
    {
        std::lock_guard<std::mutex> lg(mtx_);
        if (state_ == State::Stopped) return;
    }
    if (state() == State::Running) begin_shutdown(0);

    std::vector<std::pair<std::string, std::thread>> workers;
    std::vector<std::pair<std::string, std::function<void()>>> teardowns;
    {
        std::lock_guard<std::mutex> lg(mtx_);
        workers.swap(workers_);
        teardowns.swap(teardowns_);
    }

    for (auto& [name, t] : workers) {
        if (t.joinable()) t.join();
        spdlog::debug("ShutdownCoordinator: worker {} exited", name);
    }
    for (auto& [name, fn] : teardowns) {
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("ShutdownCoordinator: teardown {} failed: {}", name, e.what());
        }
    }

    std::lock_guard<std::mutex> lg(mtx_);
    state_ = State::Stopped;
    spdlog::info("ShutdownCoordinator: stopped");
}

ShutdownCoordinator::State ShutdownCoordinator::state() const {
    std::lock_guard<std::mutex> lg(mtx_);
    return state_;
}

std::size_t ShutdownCoordinator::spawned_count() const {
    std::lock_guard<std::mutex> lg(mtx_);
    return spawned_;
}
