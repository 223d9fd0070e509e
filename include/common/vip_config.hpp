#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "common/config.hpp"

#define VIPKEEPER_LEADER_ELECTION_KUBERNETES "kubernetes"
#define VIPKEEPER_LEADER_ELECTION_ETCD       "etcd"
#define VIPKEEPER_LEADER_ELECTION_FILE       "file"

struct BgpPeer {
    std::string Address;
    uint32_t    AS = 0;
    std::string Password;
};

struct BgpConfig {
    std::string          RouterID;
    std::string          SourceIP;
    uint32_t             AS = 65000;
    std::vector<BgpPeer> Peers;
    std::string          GobgpPath = "gobgp";
    int                  SessionPollSeconds = 5;
};

// 运行期只读的配置快照，由 load_vip_config 一次性构造
struct VipConfig {
    // 节点标识
    std::string NodeName;

    // 网卡
    std::string Interface;
    std::string ServicesInterface;
    std::string MirrorDestInterface;
    std::string WireguardInterface = "wg0";

    // 引擎开关，互斥
    bool EnableBGP          = false;
    bool EnableARP          = false;
    bool EnableWireguard    = false;
    bool EnableRoutingTable = false;

    // 集群连接
    std::string LeaderElectionType = VIPKEEPER_LEADER_ELECTION_KUBERNETES;
    std::string KubernetesAddr;
    bool        EnableControlPlane = false;
    bool        DetectControlPlane = false;
    int         Port = 6443;
    std::string Namespace = "kube-system";

    // 节点注解前缀，空表示不解析
    std::string Annotations;

    // 选主参数（秒）
    int LeaseDuration = 5;
    int RenewDeadline = 3;
    int RetryPeriod   = 1;
    std::string LeaseDir = "/var/run/vipkeeper";

    // 路由表模式
    int RoutingTableID       = 198;
    int RoutingTableProtocol = 248;

    // 指标导出，空表示不启动
    std::string MetricsAddress;

    BgpConfig BGP;
};

VipConfig load_vip_config(const Config& config);

// 服务 VIP 所在网卡：services_interface 优先，否则 interface
const std::string& service_interface(const VipConfig& config);
