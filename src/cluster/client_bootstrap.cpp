#include "cluster/client_bootstrap.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include "cluster/kube_client.hpp"
#include "cluster/kubeconfig.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<std::string> local_ipv4_addresses() {
    std::vector<std::string> out;
    ifaddrs* ifs = nullptr;
    if (getifaddrs(&ifs) != 0) {
        spdlog::warn("ClientBootstrap: getifaddrs failed, probing loopback only");
        out.push_back("127.0.0.1");
        return out;
    }
    for (ifaddrs* i = ifs; i != nullptr; i = i->ifa_next) {
        if (!i->ifa_addr || i->ifa_addr->sa_family != AF_INET) continue;
        char buf[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<sockaddr_in*>(i->ifa_addr);
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;
        std::string addr = buf;
        if (addr.rfind("127.", 0) == 0) continue;
        out.push_back(addr);
    }
    freeifaddrs(ifs);
    out.push_back("127.0.0.1");   // 回环放最后
    return out;
}

// 逐个探测，返回第一个能应答 /version 的客户端
std::unique_ptr<ClusterApi> find_working_address(const VipConfig& config, const BootstrapEnv& env) {
    for (const auto& addr : env.candidate_addresses()) {
        ClientSpec spec{VIPKEEPER_ADMIN_KUBECONFIG, false, fmt::format("{}:{}", addr, config.Port)};
        spdlog::debug("ClientBootstrap: probing API server at {}", spec.ServerOverride);
        std::unique_ptr<ClusterApi> client;
        try {
            client = env.make_client(spec);
        } catch (const std::exception& e) {
            spdlog::debug("ClientBootstrap: cannot build client for {}: {}", spec.ServerOverride, e.what());
            continue;
        }
        if (client && client->healthy()) {
            spdlog::info("ClientBootstrap: found working API server at {}", spec.ServerOverride);
            return client;
        }
    }
    throw std::runtime_error("unable to find a working kubernetes API server address");
}

} // namespace

std::unique_ptr<ClusterApi> make_kube_client(const ClientSpec& spec) {
    KubeClientOptions opt = spec.InCluster ? in_cluster_options() : load_kubeconfig(spec.Kubeconfig);
    if (!spec.ServerOverride.empty()) {
        opt.Server = normalize_server(spec.ServerOverride);
    }
    return std::make_unique<KubeClient>(std::move(opt));
}

BootstrapEnv default_bootstrap_env() {
    BootstrapEnv env;
    env.file_exists = [](const std::string& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    };
    env.home_dir = [] {
        const char* home = std::getenv("HOME");
        return std::string(home ? home : "");
    };
    env.candidate_addresses = local_ipv4_addresses;
    env.make_client = make_kube_client;
    env.service_account_namespace = []() -> std::optional<std::string> {
        std::ifstream ifs(std::string(VIPKEEPER_SERVICE_ACCOUNT_DIR) + "/namespace");
        if (!ifs) return std::nullopt;
        std::string ns;
        std::getline(ifs, ns);
        return ns;
    };
    return env;
}

std::unique_ptr<ClusterApi> resolve_client(const VipConfig& config, const BootstrapEnv& env) {
    if (config.LeaderElectionType == VIPKEEPER_LEADER_ELECTION_ETCD) {
        // etcd 选主不需要 k8s 客户端
        spdlog::info("ClientBootstrap: leader election uses etcd, no kubernetes client constructed");
        return nullptr;
    }

    const std::string admin_path = VIPKEEPER_ADMIN_KUBECONFIG;
    const std::string home = env.home_dir();
    const std::string home_path = home.empty() ? std::string{} : (fs::path(home) / ".kube" / "config").string();

    std::unique_ptr<ClusterApi> client;
    if (env.file_exists(admin_path)) {
        try {
            if (!config.KubernetesAddr.empty()) {
                spdlog::info("ClientBootstrap: using API server override {}", config.KubernetesAddr);
                client = env.make_client({admin_path, false, config.KubernetesAddr});
            } else if (config.EnableControlPlane) {
                // 控制面节点上 VIP 可能尚未就绪，直接连本机
                if (config.DetectControlPlane) {
                    client = find_working_address(config, env);
                } else {
                    // kubernetes 需要作为 host alias 写进 pod manifest
                    client = env.make_client({admin_path, false, fmt::format("kubernetes:{}", config.Port)});
                }
            } else {
                client = env.make_client({admin_path, false, ""});
            }
        } catch (const std::exception& e) {
            throw std::runtime_error(fmt::format(
                "could not create k8s clientset from external file: \"{}\": {}", admin_path, e.what()));
        }
        spdlog::debug("ClientBootstrap: using external Kubernetes configuration from file [{}]", admin_path);
    } else if (!home_path.empty() && env.file_exists(home_path)) {
        try {
            client = env.make_client({home_path, false, ""});
        } catch (const std::exception& e) {
            throw std::runtime_error(fmt::format(
                "could not create k8s clientset from external file: \"{}\": {}", home_path, e.what()));
        }
        spdlog::debug("ClientBootstrap: using external Kubernetes configuration from file [{}]", home_path);
    } else {
        try {
            client = env.make_client({"", true, ""});
        } catch (const std::exception& e) {
            throw std::runtime_error(fmt::format(
                "could not create k8s clientset from incluster config: {}", e.what()));
        }
        spdlog::debug("ClientBootstrap: using Kubernetes configuration from incluster config");
    }

    if (!client) {
        throw std::runtime_error("could not create k8s clientset: factory returned no client");
    }
    return client;
}

std::string resolve_lease_namespace(const VipConfig& config, const BootstrapEnv& env) {
    std::optional<std::string> ns;
    if (env.service_account_namespace) ns = env.service_account_namespace();
    if (ns) {
        const auto end = ns->find_last_not_of(" \t\r\n");
        ns->erase(end == std::string::npos ? 0 : end + 1);
    }
    if (!ns || ns->empty()) {
        spdlog::warn("ClientBootstrap: unable to read service account namespace, using configured namespace {}",
                     config.Namespace);
        return config.Namespace;
    }
    return *ns;
}
