#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/stop_token.hpp"

#define VIPKEEPER_LB_IPS_ANNOTATION "kube-vip.io/loadbalancerIPs"

struct ServiceInfo {
    std::string UID;
    std::string Name;
    std::string Namespace;
    std::string Type;        // LoadBalancer / ClusterIP / ...
    std::string VIP;         // 空表示没有可通告的地址
    std::string ResourceVersion;
};

struct ServiceEvent {
    std::string Type;        // ADDED / MODIFIED / DELETED / BOOKMARK / ERROR / SYNC
    ServiceInfo Service;
    std::vector<ServiceInfo> Items;   // 仅 SYNC：重新 list 得到的全部服务
};

// coordination.k8s.io/v1 Lease 的精简视图
struct LeaseRecord {
    std::string HolderIdentity;
    int         LeaseDurationSeconds = 0;
    std::string AcquireTime;
    std::string RenewTime;
    int         LeaseTransitions = 0;
    std::string ResourceVersion;   // 乐观并发控制

    bool operator==(const LeaseRecord& o) const {
        return HolderIdentity == o.HolderIdentity &&
               RenewTime == o.RenewTime &&
               ResourceVersion == o.ResourceVersion;
    }
    bool operator!=(const LeaseRecord& o) const { return !(*this == o); }
};

using ServiceEventCb = std::function<void(const ServiceEvent&)>;

// 集群 API 能力接口；构造完成后可被多个 worker 并发使用
class ClusterApi {
public:
    virtual ~ClusterApi() = default;

    virtual std::string server() const = 0;

    // 探活：GET /version
    virtual bool healthy() = 0;

    // 读取节点注解，失败抛 std::runtime_error
    virtual std::map<std::string, std::string> node_annotations(const std::string& node) = 0;

    // 持续监听 Service 变化，直到 stop 被触发才返回；断线自动重连。
    // 每次从头建立 watch（首次或版本过期）前先 list，并以一个 SYNC 事件交付全量列表
    virtual void watch_services(const ServiceEventCb& cb, const StopToken& stop) = 0;

    // 租约：不存在返回 nullopt；create/update 冲突返回 false，其它错误抛出
    virtual std::optional<LeaseRecord> get_lease(const std::string& ns, const std::string& name) = 0;
    virtual bool create_lease(const std::string& ns, const std::string& name, const LeaseRecord& rec) = 0;
    virtual bool update_lease(const std::string& ns, const std::string& name, const LeaseRecord& rec) = 0;
};
