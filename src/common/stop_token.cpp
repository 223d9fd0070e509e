#include "common/stop_token.hpp"

#include <algorithm>
#include <stdexcept>

/*---------------- StopToken ----------------*/
bool StopToken::stop_requested() const {
    if (!state_) return false;
    std::lock_guard lg(state_->m);
    return state_->stopped;
}

bool StopToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        // 永不触发的 token：退化为普通 sleep
        std::mutex m;
        std::condition_variable cv;
        std::unique_lock lk(m);
        cv.wait_for(lk, timeout, [] { return false; });
        return false;
    }
    std::unique_lock lk(state_->m);
    return state_->cv.wait_for(lk, timeout, [this] { return state_->stopped; });
}

void StopToken::wait() const {
    if (!state_) {
        throw std::logic_error("StopToken: wait() on a token without a source would block forever");
    }
    std::unique_lock lk(state_->m);
    state_->cv.wait(lk, [this] { return state_->stopped; });
}

StopSource StopToken::make_child() const {
    auto child = std::make_shared<State>();
    if (state_) {
        std::lock_guard lg(state_->m);
        if (state_->stopped) {
            child->stopped = true;
        } else {
            auto& kids = state_->children;
            kids.erase(std::remove_if(kids.begin(), kids.end(),
                                      [](const std::weak_ptr<State>& w) { return w.expired(); }),
                       kids.end());
            kids.push_back(child);
        }
    }
    return StopSource(child);
}

/*---------------- StopSource ----------------*/
StopSource::StopSource() : state_(std::make_shared<StopToken::State>()) {}

bool StopSource::request_stop() {
    return fire(state_);
}

bool StopSource::stop_requested() const {
    std::lock_guard lg(state_->m);
    return state_->stopped;
}

StopToken StopSource::token() const {
    return StopToken(state_);
}

bool StopSource::fire(const std::shared_ptr<StopToken::State>& state) {
    std::vector<std::weak_ptr<StopToken::State>> children;
    {
        std::lock_guard lg(state->m);
        if (state->stopped) return false;
        state->stopped = true;
        children.swap(state->children);
    }
    state->cv.notify_all();

    // 锁外级联，避免父子锁嵌套
    for (auto& weak : children) {
        if (auto child = weak.lock()) fire(child);
    }
    return true;
}
