#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "common/stop_token.hpp"
#include "election/lease_lock.hpp"

/*==========================================================
 * 基于租约的选主
 *
 * acquire-or-renew：持有者在 lease_duration 内未更新记录即视为过期；
 * 成为 leader 后每个 retry_period 续约一次，renew_deadline 内续不上则让位。
 *=========================================================*/
class LeaderElector {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::string          identity;
        std::chrono::seconds lease_duration{5};
        std::chrono::seconds renew_deadline{3};
        std::chrono::seconds retry_period{1};
    };

    // 构造参数非法抛 std::invalid_argument
    LeaderElector(std::unique_ptr<LeaseLock> lock, Options opt);

    void set_become_leader_callback(std::function<void(void)> cb);
    void set_lose_leader_callback(std::function<void(void)> cb);

    // 竞选一轮：拿到租约 -> 回调 -> 续约直到失败或 stop -> 回调
    // 未当选便被 stop 时直接返回 false
    bool run_once(const StopToken& stop);

    bool is_leader() const { return is_leader_.load(); }
    const std::string& identity() const { return opt_.identity; }
    std::string lock_description() const { return lock_->describe(); }

    // 单次尝试，供 run_once 与测试调用
    bool try_acquire_or_renew();

private:
    bool acquire(const StopToken& stop);
    void renew(const StopToken& stop);

    // 主动放弃：清空持有者
    void release();

    std::unique_ptr<LeaseLock>  lock_;
    Options                     opt_;

    std::function<void(void)>   become_leader_callback_;
    std::function<void(void)>   lose_leader_callback_;

    std::optional<LeaseRecord>  observed_;
    Clock::time_point           observed_time_{};
    std::atomic<bool>           is_leader_{false};
};
