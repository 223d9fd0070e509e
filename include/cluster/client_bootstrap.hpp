#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cluster/cluster_api.hpp"
#include "common/vip_config.hpp"

#define VIPKEEPER_ADMIN_KUBECONFIG "/etc/kubernetes/admin.conf"

// 描述一次客户端构造请求
struct ClientSpec {
    std::string Kubeconfig;        // 空表示不使用文件
    bool        InCluster = false;
    std::string ServerOverride;    // 空表示使用文件里的地址
};

using ClientFactory = std::function<std::unique_ptr<ClusterApi>(const ClientSpec&)>;

// 启动期与外界交互的全部入口，测试时整体替换
struct BootstrapEnv {
    std::function<bool(const std::string&)>  file_exists;
    std::function<std::string()>             home_dir;
    std::function<std::vector<std::string>()> candidate_addresses;  // 控制面探测候选（不含端口）
    ClientFactory                            make_client;
    std::function<std::optional<std::string>()> service_account_namespace;  // 未设置视为文件不存在
};

// 真实环境：std::filesystem + $HOME + getifaddrs + KubeClient
BootstrapEnv default_bootstrap_env();

// 默认工厂：kubeconfig / in-cluster -> KubeClient
std::unique_ptr<ClusterApi> make_kube_client(const ClientSpec& spec);

// 按固定顺序决定如何连接集群；etcd 选主时返回 nullptr；构造失败抛 std::runtime_error
std::unique_ptr<ClusterApi> resolve_client(const VipConfig& config, const BootstrapEnv& env);

// 租约所在命名空间：优先 service account 的 namespace 文件，否则回落到配置
std::string resolve_lease_namespace(const VipConfig& config, const BootstrapEnv& env);
