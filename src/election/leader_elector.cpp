#include "election/leader_elector.hpp"

#include <stdexcept>

#include <fmt/core.h>

LeaderElector::LeaderElector(std::unique_ptr<LeaseLock> lock, Options opt)
    : lock_(std::move(lock)), opt_(std::move(opt))
{
    if (!lock_) {
        throw std::invalid_argument("LeaderElector: lease lock must not be null");
    }
    if (opt_.identity.empty()) {
        throw std::invalid_argument("LeaderElector: identity must not be empty");
    }
    if (opt_.retry_period.count() <= 0 || opt_.renew_deadline.count() <= 0) {
        throw std::invalid_argument("LeaderElector: retry_period and renew_deadline must be positive");
    }
    if (opt_.lease_duration <= opt_.renew_deadline) {
        throw std::invalid_argument("LeaderElector: lease_duration must be greater than renew_deadline");
    }
}

void LeaderElector::set_become_leader_callback(std::function<void(void)> cb) {
    become_leader_callback_ = std::move(cb);
}

void LeaderElector::set_lose_leader_callback(std::function<void(void)> cb) {
    lose_leader_callback_ = std::move(cb);
}

/*------------------------------------------------------
 * 单次尝试
 *----------------------------------------------------*/
bool LeaderElector::try_acquire_or_renew() {
    const auto now = Clock::now();
    const std::string stamp = now_micro_time();

    LeaseRecord desired;
    desired.HolderIdentity       = opt_.identity;
    desired.LeaseDurationSeconds = static_cast<int>(opt_.lease_duration.count());
    desired.AcquireTime          = stamp;
    desired.RenewTime            = stamp;

    try {
        auto current = lock_->get();
        if (!current) {
            if (!lock_->create(desired)) {
                spdlog::debug("LeaderElector: lease {} was created concurrently", lock_->describe());
                return false;
            }
            observed_      = desired;
            observed_time_ = now;
            return true;
        }

        // 记录有变化才刷新观测时间，过期判断只依赖本地时钟
        if (!observed_ || *observed_ != *current) {
            observed_      = *current;
            observed_time_ = now;
        }

        const bool held_by_other = !current->HolderIdentity.empty() &&
                                   current->HolderIdentity != opt_.identity;
        if (held_by_other && observed_time_ + opt_.lease_duration > now) {
            return false;
        }

        if (current->HolderIdentity == opt_.identity) {
            desired.AcquireTime      = current->AcquireTime;
            desired.LeaseTransitions = current->LeaseTransitions;
        } else {
            desired.LeaseTransitions = current->LeaseTransitions + 1;
        }
        desired.ResourceVersion = current->ResourceVersion;

        if (!lock_->update(desired)) {
            spdlog::debug("LeaderElector: lease {} update conflict", lock_->describe());
            return false;
        }
        observed_      = desired;
        observed_time_ = now;
        return true;
    } catch (const std::exception& e) {
        spdlog::error("LeaderElector: error retrieving resource lock {}: {}", lock_->describe(), e.what());
        return false;
    }
}

/*------------------------------------------------------
 * 竞选 / 续约 / 释放
 *----------------------------------------------------*/
bool LeaderElector::acquire(const StopToken& stop) {
    spdlog::debug("LeaderElector: attempting to acquire leader lease {}", lock_->describe());
    while (!stop.stop_requested()) {
        if (try_acquire_or_renew()) {
            spdlog::info("LeaderElector: successfully acquired lease {}", lock_->describe());
            return true;
        }
        if (stop.wait_for(opt_.retry_period)) break;
    }
    return false;
}

void LeaderElector::renew(const StopToken& stop) {
    while (!stop.stop_requested()) {
        const auto deadline = Clock::now() + opt_.renew_deadline;
        bool renewed = false;
        for (;;) {
            if (try_acquire_or_renew()) {
                renewed = true;
                break;
            }
            if (Clock::now() >= deadline) break;
            if (stop.wait_for(opt_.retry_period)) return;
        }
        if (!renewed) {
            spdlog::warn("LeaderElector: failed to renew lease {} within {}s",
                         lock_->describe(), opt_.renew_deadline.count());
            is_leader_ = false;
            return;
        }
        if (stop.wait_for(opt_.retry_period)) return;
    }
}

void LeaderElector::release() {
    try {
        auto current = lock_->get();
        if (!current || current->HolderIdentity != opt_.identity) {
            return;
        }
        LeaseRecord rec          = *current;
        const std::string stamp  = now_micro_time();
        rec.HolderIdentity       = "";
        rec.LeaseDurationSeconds = 1;
        rec.AcquireTime          = stamp;
        rec.RenewTime            = stamp;
        if (!lock_->update(rec)) {
            spdlog::warn("LeaderElector: lease {} changed while releasing", lock_->describe());
            return;
        }
        spdlog::info("LeaderElector: released lease {}", lock_->describe());
    } catch (const std::exception& e) {
        spdlog::error("LeaderElector: failed to release lease {}: {}", lock_->describe(), e.what());
    }
}

bool LeaderElector::run_once(const StopToken& stop) {
    is_leader_ = false;
    if (!acquire(stop)) {
        return false;
    }
    is_leader_ = true;

    if (become_leader_callback_) {
        try {
            become_leader_callback_();
        } catch (const std::exception&) {
            // 通告失败，让出租约后交给调用方处理
            is_leader_ = false;
            release();
            throw;
        }
    }

    renew(stop);
    const bool still_held = is_leader_.exchange(false);

    if (lose_leader_callback_) lose_leader_callback_();

    // 被 stop 打断时仍持有租约，主动释放让其它节点尽快接管
    if (still_held) release();
    return true;
}
