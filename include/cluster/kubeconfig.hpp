#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <string>

#define VIPKEEPER_SERVICE_ACCOUNT_DIR "/var/run/secrets/kubernetes.io/serviceaccount"

struct KubeClientOptions {
    std::string Server;               // https://host:port
    std::string CaPem;
    bool        InsecureSkipVerify = false;
    std::string Token;
    std::string ClientCertPem;
    std::string ClientKeyPem;
    long        TimeoutSeconds = 10;
};

// 解析 kubeconfig（current-context 指向的 cluster/user），失败抛 std::runtime_error
KubeClientOptions load_kubeconfig(const std::string& path);

// 基于 service account 的集群内配置，失败抛 std::runtime_error
KubeClientOptions in_cluster_options();

// "host:port" -> "https://host:port"，已带 scheme 的原样返回
std::string normalize_server(const std::string& address);

std::string base64_decode(const std::string& in);
