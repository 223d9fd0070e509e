#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <optional>
#include <string>

#include "cluster/cluster_api.hpp"

// 所有服务共享的锁名前缀
#define VIPKEEPER_PLUNDER_LOCK "plndr-svcs-lock"

// 选主用的租约存储；update 依赖 ResourceVersion 做乐观并发
class LeaseLock {
public:
    virtual ~LeaseLock() = default;

    // 不存在返回 nullopt
    virtual std::optional<LeaseRecord> get() = 0;

    // 已存在 / 版本冲突返回 false；存储故障抛 std::runtime_error
    virtual bool create(const LeaseRecord& rec) = 0;
    virtual bool update(const LeaseRecord& rec) = 0;

    virtual std::string describe() const = 0;
};

// coordination.k8s.io/v1 Lease
class KubeLeaseLock : public LeaseLock {
public:
    KubeLeaseLock(ClusterApi& client, std::string ns, std::string name);

    std::optional<LeaseRecord> get() override;
    bool create(const LeaseRecord& rec) override;
    bool update(const LeaseRecord& rec) override;
    std::string describe() const override;

private:
    ClusterApi& client_;
    std::string ns_;
    std::string name_;
};

// RFC3339 微秒精度 UTC 时间，形如 2024-01-02T03:04:05.000006Z
std::string now_micro_time();
