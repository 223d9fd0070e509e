#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

class StopSource;

/*==========================================================
 * 广播式停止信号（只读端）
 *
 * 所有 worker 共用一个根信号；触发后不可复位。
 * 默认构造的 token 永远不会被触发。
 *=========================================================*/
class StopToken {
public:
    StopToken() = default;

    bool stop_requested() const;

    // 等待至多 timeout，期间被触发返回 true
    bool wait_for(std::chrono::milliseconds timeout) const;

    // 阻塞直到被触发
    void wait() const;

    // 派生一个子信号源：父触发时子随之触发，子触发不影响父
    StopSource make_child() const;

private:
    friend class StopSource;
    struct State;
    explicit StopToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class StopSource {
public:
    StopSource();

    // 仅第一次调用返回 true
    bool request_stop();
    bool stop_requested() const;
    StopToken token() const;

private:
    friend class StopToken;
    explicit StopSource(std::shared_ptr<StopToken::State> state) : state_(std::move(state)) {}
    static bool fire(const std::shared_ptr<StopToken::State>& state);

    std::shared_ptr<StopToken::State> state_;
};

struct StopToken::State {
    mutable std::mutex                 m;
    mutable std::condition_variable    cv;
    bool                               stopped = false;
    std::vector<std::weak_ptr<State>>  children;
};
